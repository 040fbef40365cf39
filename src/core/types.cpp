#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "None";
        case ErrorKind::ResourceNotFound:        return "ResourceNotFound";
        case ErrorKind::StartFailed:             return "StartFailed";
        case ErrorKind::AddressUnresolved:       return "AddressUnresolved";
        case ErrorKind::InvalidHostKey:          return "InvalidHostKey";
        case ErrorKind::ConnectFailed:           return "ConnectFailed";
        case ErrorKind::InstanceNotUsable:       return "InstanceNotUsable";
        case ErrorKind::CommandTransportFailure: return "CommandTransportFailure";
        case ErrorKind::SourceInvalid:           return "SourceInvalid";
        case ErrorKind::ConfigInvalid:           return "ConfigInvalid";
    }
    return "Unknown";
}
