#include "sync/authenticator.hpp"

namespace tally::sync {

Result<Credentials, Error> TokenAuthenticator::sign_in(const std::string& client_id) {
    if (client_id.empty()) {
        return Result<Credentials, Error>::err(
            Error{ErrorKind::AuthFailed, "client id is not configured"});
    }
    if (token_.empty()) {
        return Result<Credentials, Error>::err(
            Error{ErrorKind::AuthFailed, "no sync token configured for " + client_id});
    }
    return Result<Credentials, Error>::ok(Credentials{
        .client_id = client_id,
        .access_token = token_
    });
}

Result<Credentials, Error> LocalAuthenticator::sign_in(const std::string& client_id) {
    if (client_id.empty()) {
        return Result<Credentials, Error>::err(
            Error{ErrorKind::AuthFailed, "client id is not configured"});
    }
    return Result<Credentials, Error>::ok(Credentials{.client_id = client_id, .access_token = {}});
}

} // namespace tally::sync
