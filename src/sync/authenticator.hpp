#pragma once

#include "sync/blob_store.hpp"
#include "core/result.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tally::sync {

struct Credentials {
    std::string client_id;
    std::string access_token;
};

/**
 * Authenticator - Exchanges a client id for credentials the blob store
 * accepts. Failure is AuthFailed.
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    [[nodiscard]] virtual Result<Credentials, Error> sign_in(const std::string& client_id) = 0;
};

/**
 * TokenAuthenticator - A pre-issued bearer token from configuration.
 */
class TokenAuthenticator : public Authenticator {
public:
    explicit TokenAuthenticator(std::string token) : token_(std::move(token)) {}

    [[nodiscard]] Result<Credentials, Error> sign_in(const std::string& client_id) override;

private:
    std::string token_;
};

/**
 * LocalAuthenticator - For stores that need no secret, such as a shared
 * directory. Only the client id is checked.
 */
class LocalAuthenticator : public Authenticator {
public:
    [[nodiscard]] Result<Credentials, Error> sign_in(const std::string& client_id) override;
};

/**
 * Builds the blob store once credentials are available.
 */
using BlobStoreFactory =
    std::function<Result<std::shared_ptr<BlobStore>, Error>(const Credentials&)>;

} // namespace tally::sync
