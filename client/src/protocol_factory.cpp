#include "skiff/client/protocol_factory.hpp"

#include "skiff/client/ftp_session.hpp"
#include "skiff/client/sftp_session.hpp"
#include "skiff/errors.hpp"

namespace skiff::client
{

    std::unique_ptr<ProtocolSession> create_session(const ConnectionProfile &profile, const SessionOptions &options,
                                                    const CredentialStore &credentials)
    {
        if (profile.host.empty())
        {
            throw ProtocolError("profile " + profile.id + " has no host");
        }
        switch (profile.scheme)
        {
        case Scheme::Ftp:
        {
            auto plain = profile;
            plain.tls = TlsMode::None;
            return std::make_unique<FtpSession>(std::move(plain), options, credentials);
        }
        case Scheme::Ftps:
        {
            auto secure = profile;
            if (secure.tls == TlsMode::None)
            {
                secure.tls = TlsMode::Implicit;
            }
            return std::make_unique<FtpSession>(std::move(secure), options, credentials);
        }
        case Scheme::Sftp:
            return std::make_unique<SftpSession>(profile, options, credentials);
        }
        throw ProtocolError("unsupported scheme");
    }

    SessionFactory make_session_factory(SessionOptions options, const CredentialStore &credentials)
    {
        return [options = std::move(options), &credentials](const ConnectionProfile &profile)
        {
            return create_session(profile, options, credentials);
        };
    }

} // namespace skiff::client
