#include "sgnet/net/SocketError.hpp"

#include <cerrno>

namespace sgnet::net {

SocketError socketErrorFromErrno(int error_code) noexcept {
    switch (error_code) {
        case 0:
            return SocketError::Success;
        case EINVAL:
        case EOVERFLOW:
        case ESPIPE:
            return SocketError::InvalidArgument;
        case EPIPE:
        case ESHUTDOWN:
            return SocketError::Shutdown;
        case ENOTCONN:
            return SocketError::NotConnected;
        case ECONNRESET:
            return SocketError::ConnectionReset;
        case ECONNABORTED:
            return SocketError::ConnectionAborted;
        case ETIMEDOUT:
            return SocketError::TimedOut;
        case ENOBUFS:
        case ENOMEM:
            return SocketError::NoBufferSpaceAvailable;
        case ECANCELED:
        case EBADF:
            return SocketError::OperationAborted;
        case EHOSTUNREACH:
            return SocketError::HostUnreachable;
        case ENETDOWN:
        case ENETUNREACH:
            return SocketError::NetworkDown;
        case EACCES:
        case EPERM:
            return SocketError::AccessDenied;
        case EIO:
            return SocketError::IOError;
        default:
            return SocketError::OtherError;
    }
}

const char* toString(SocketError error) noexcept {
    switch (error) {
        case SocketError::Success:
            return "Success";
        case SocketError::InvalidArgument:
            return "InvalidArgument";
        case SocketError::Shutdown:
            return "Shutdown";
        case SocketError::NotConnected:
            return "NotConnected";
        case SocketError::ConnectionReset:
            return "ConnectionReset";
        case SocketError::ConnectionAborted:
            return "ConnectionAborted";
        case SocketError::TimedOut:
            return "TimedOut";
        case SocketError::NoBufferSpaceAvailable:
            return "NoBufferSpaceAvailable";
        case SocketError::OperationAborted:
            return "OperationAborted";
        case SocketError::HostUnreachable:
            return "HostUnreachable";
        case SocketError::NetworkDown:
            return "NetworkDown";
        case SocketError::AccessDenied:
            return "AccessDenied";
        case SocketError::IOError:
            return "IOError";
        case SocketError::OtherError:
            return "OtherError";
    }
    return "OtherError";
}

}  // namespace sgnet::net
