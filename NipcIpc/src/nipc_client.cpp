#include "nipc_client.hpp"
#include "nipc_log.hpp"

#include <utility>

namespace nipc {
    namespace ipc {

        Client::Client(ConnectionOptions opt) : conn_(std::move(opt)) {
        }

        IpcResult Client::connect(const std::string& socket_path) {
            return conn_.open(socket_path);
        }

        IpcResult Client::ping() {
            IpcResult r = conn_.execute(Command::ping());
            if (r.ok && !r.data.is_string()) {
                NIPC_LOG_WRN("CLIENT", "ping reply is not a string: %s", r.data.dump().c_str());
            }
            return r;
        }

        IpcResult Client::query_network_state(const QueryOptions& opt) {
            return conn_.execute(Command::query(opt));
        }

        IpcResult Client::apply_network_state(const nlohmann::json& desired_state, const ApplyOptions& opt) {
            return conn_.execute(Command::apply(desired_state, opt));
        }

        IpcResult show(const std::string& socket_path) {
            Client cli;
            IpcResult r = cli.connect(socket_path);
            if (!r.ok) return r;
            return cli.query_network_state(QueryOptions::running());
        }

        IpcResult apply(const nlohmann::json& desired_state, bool verify_change, const std::string& socket_path) {
            Client cli;
            IpcResult r = cli.connect(socket_path);
            if (!r.ok) return r;
            return cli.apply_network_state(desired_state, ApplyOptions::with_verify(verify_change));
        }

    } // namespace ipc
} // namespace nipc
