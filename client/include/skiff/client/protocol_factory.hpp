#pragma once

#include <functional>
#include <memory>

#include "skiff/client/protocol_session.hpp"

namespace skiff::client
{

    class CredentialStore;

    // Maps a profile's scheme onto its session variant. Never opens a connection.
    std::unique_ptr<ProtocolSession> create_session(const ConnectionProfile &profile, const SessionOptions &options,
                                                    const CredentialStore &credentials);

    using SessionFactory = std::function<std::unique_ptr<ProtocolSession>(const ConnectionProfile &)>;

    // The credential store must outlive every session the factory creates.
    SessionFactory make_session_factory(SessionOptions options, const CredentialStore &credentials);

} // namespace skiff::client
