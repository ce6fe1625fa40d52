#ifndef KUBE_CLIENT_TRANSPORT_INTERFACE_HPP
#define KUBE_CLIENT_TRANSPORT_INTERFACE_HPP

#include "../model/model.hpp"

namespace kube::transport {
    // Issues exactly one request. Implementations throw error::TransportError when no
    // HTTP status could be obtained and must be safe to call from several threads.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        virtual kube::model::Response invoke(const kube::model::Request& req) const = 0;
    };
}  // namespace kube::transport

#endif
