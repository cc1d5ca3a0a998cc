#include "proxy/response_retriever.hpp"
#include "proxy/json_rpc.hpp"
#include "utils/logger.hpp"

namespace rpc_snoop {
namespace proxy {

ResponseRetriever::ResponseRetriever(protocol::HttpTransport* transport)
    : transport_(transport)
{
}

utils::Result<RetrievedResponse> ResponseRetriever::retrieve(const ForwardedRequest& forwarded) const {
    auto sent = transport_->send(forwarded.destination, forwarded.request);
    if (sent.is_err()) {
        LOG_ERROR("Proxy", "Upstream %s failed: %s",
                  forwarded.destination.to_string().c_str(), sent.error_message().c_str());
        return utils::make_err<RetrievedResponse>(sent.error_code(), sent.error_message());
    }

    RetrievedResponse retrieved;
    retrieved.response = sent.take();
    retrieved.display_json = render_display_json(retrieved.response.body);
    return utils::make_ok(std::move(retrieved));
}

} // namespace proxy
} // namespace rpc_snoop
