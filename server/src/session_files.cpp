#include "minishare/server/session.hpp"

#include <spdlog/spdlog.h>

namespace minishare::server
{

    void Session::handle_list()
    {
        const auto entries = services_.store.list();
        send(minishare::protocol::Response::success(minishare::protocol::format_listing(entries)));
        spdlog::info("[{}] Listed {} files", peer_, entries.size());
    }

    void Session::handle_delete(const minishare::protocol::Command &command)
    {
        services_.store.remove(command.name);
        send(minishare::protocol::Response::success("deleted: " + command.name));
        spdlog::info("[{}] Deleted file: {}", peer_, command.name);
    }

} // namespace minishare::server
