#include "errors.h"

const char* to_string(ErrorKind p_kind) {
    switch (p_kind) {
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::AddressSpaceExhausted: return "AddressSpaceExhausted";
        case ErrorKind::ProvisioningError: return "ProvisioningError";
        case ErrorKind::BackendUnreachable: return "BackendUnreachable";
    }
    return "Unknown";
}
