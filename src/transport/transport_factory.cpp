#include "transport/transport_factory.hpp"
#include <memory>
#include <string_view>
#include "common/log.hpp"
#include "transport/resource_name.hpp"
#include "transport/serial_transport.hpp"
#include "transport/tcp_transport.hpp"

namespace apsyn {

std::unique_ptr<ByteTransport> ResourceTransportFactory::Open(std::string_view address) {
  auto resource = ParseResourceName(address);
  if (!resource.has_value()) {
    Logger()->error("Unrecognised resource name '{}'", address);
    return nullptr;
  }

  switch (resource->kind) {
    case ResourceKind::kTcpSocket:
      return TcpTransport::Connect(resource->host, resource->port);
    case ResourceKind::kSerial: {
      auto transport = std::make_unique<SerialTransport>(resource->device, serial_settings_);
      if (!transport->IsOpen()) {
        return nullptr;
      }
      return transport;
    }
    case ResourceKind::kVxi11:
      Logger()->error("VXI-11 resource '{}' is not supported; use TCPIP0::{}::<port>::SOCKET", address,
                      resource->host);
      return nullptr;
  }
  return nullptr;
}

}  // namespace apsyn
