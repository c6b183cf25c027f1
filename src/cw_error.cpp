/**
 * @file cw_error.cpp
 * @brief Error code names
 */

#include "cw_error.h"

const char* cwError_toString(CwError err) {
    switch (err) {
        case CW_OK:                         return "OK";
        case CW_ERR_IO:                     return "I/O error";
        case CW_ERR_TIMEOUT:                return "timeout";
        case CW_ERR_MALFORMED:              return "malformed response";
        case CW_ERR_BUSY:                   return "busy";
        case CW_ERR_DEVICE_UNRESPONSIVE:    return "device unresponsive";
        case CW_ERR_PROTOCOL_FAILURE:       return "protocol failure";
        case CW_ERR_UPGRADE_ABORTED:        return "upgrade aborted";
        case CW_ERR_PORT_LOCKED:            return "port locked";
        case CW_ERR_NOT_OPEN:               return "not open";
        case CW_ERR_INVALID_ARG:            return "invalid argument";
        case CW_ERR_UNEXPECTED_RESPONSE:    return "unexpected response";
    }
    return "unknown error";
}
