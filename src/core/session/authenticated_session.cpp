#include "vaultwire/core/session/authenticated_session.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/util/base64.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <system_error>

namespace vaultwire {

    namespace {
        std::vector<uint8_t> bytesOf(const std::string& s) {
            return std::vector<uint8_t>(s.begin(), s.end());
        }

        std::vector<uint8_t> jsonBody(const nlohmann::json& j) {
            return bytesOf(j.dump());
        }
    }

    const char* toString(SessionState s) noexcept {
        switch (s) {
        case SessionState::Anonymous:         return "Anonymous";
        case SessionState::AwaitingChallenge: return "AwaitingChallenge";
        case SessionState::Authenticated:     return "Authenticated";
        }
        return "Unknown";
    }

    AuthenticatedSession::AuthenticatedSession(ClientConfig config)
        : client_(std::move(config)) {
        const auto& dir = client_.config().keysDirectory;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw ConfigError("cannot create key directory " + dir.string() + ": " + ec.message());
    }

    /*──────────────── keys ────────────────*/

    const RsaKeyPair& AuthenticatedSession::keysLocked() {
        if (!keys_) {
            LOG_INFO("[AuthenticatedSession] no key pair loaded, generating a new one");
            keys_.emplace(RsaKeyPair::generate());
        }
        return *keys_;
    }

    void AuthenticatedSession::importKeys(const std::filesystem::path& publicKeyFile,
                                          const std::filesystem::path& privateKeyFile) {
        auto loaded = RsaKeyPair::loadFiles(publicKeyFile, privateKeyFile);
        std::scoped_lock lk(mtx_);
        keys_.emplace(std::move(loaded));
        LOG_DEBUG(std::string("[AuthenticatedSession] imported ") + std::to_string(keys_->bits()) + "-bit key" +
                  (keys_->hasPrivateKey() ? " pair" : " (public only)"));
    }

    std::pair<std::filesystem::path, std::filesystem::path>
    AuthenticatedSession::createNewKeys(const std::string& publicKeyFileName, const std::string& privateKeyFileName) {
        std::scoped_lock lk(mtx_);
        const auto& dir = client_.config().keysDirectory;
        auto publicPath = dir / publicKeyFileName;
        auto privatePath = dir / privateKeyFileName;

        auto fresh = RsaKeyPair::generate();
        fresh.saveFiles(publicPath, privatePath);
        keys_.emplace(std::move(fresh));

        LOG_INFO("[AuthenticatedSession] wrote new key pair to " + publicPath.string() + " and " + privatePath.string());
        return { publicPath, privatePath };
    }

    bool AuthenticatedSession::hasKeys() const {
        std::scoped_lock lk(mtx_);
        return keys_.has_value();
    }

    std::string AuthenticatedSession::publicKeyBase64() {
        std::scoped_lock lk(mtx_);
        return base64Encode(keysLocked().publicKeyDer());
    }

    std::string AuthenticatedSession::decryptPassword(const std::vector<uint8_t>& ciphertext) const {
        std::scoped_lock lk(mtx_);
        if (!keys_)
            throw CryptoError("no key pair loaded");
        auto plain = keys_->decrypt(ciphertext);
        return std::string(plain.begin(), plain.end());
    }

    /*──────────────── login ────────────────*/

    Message AuthenticatedSession::createUser(const std::string& username) {
        std::scoped_lock lk(mtx_);
        nlohmann::json body = {
            { "userName",  username },
            { "publicKey", base64Encode(keysLocked().publicKeyDer()) }
        };
        return client_.exchange(methods::CreateUser, jsonBody(body), kNoSession, content_types::Json);
    }

    Message AuthenticatedSession::loginRequestLocked(const std::string& username) {
        state_ = SessionState::AwaitingChallenge;
        pending_.reset();
        token_.reset();

        Message res = [&] {
            try {
                return client_.exchange(methods::LoginRequest, bytesOf(username), kRequestSession, content_types::Ascii);
            }
            catch (...) {
                state_ = SessionState::Anonymous;
                throw;
            }
        }();

        if (res.body().empty()) {
            LOG_INFO("[AuthenticatedSession] login request for '" + username + "' refused");
            state_ = SessionState::Anonymous;
            return res;
        }

        pending_ = res.header(headers::Session);
        if (!pending_) {
            LOG_WARN("[AuthenticatedSession] login challenge arrived without a session token");
            state_ = SessionState::Anonymous;
        }
        return res;
    }

    Message AuthenticatedSession::loginRequest(const std::string& username) {
        std::scoped_lock lk(mtx_);
        return loginRequestLocked(username);
    }

    Message AuthenticatedSession::loginTestLocked(const std::vector<uint8_t>& challenge, const std::string& session) {
        std::vector<uint8_t> number;
        try {
            if (!keys_)
                throw CryptoError("no key pair loaded");
            number = keys_->decrypt(challenge);
        }
        catch (const CryptoError&) {
            state_ = SessionState::Anonymous;
            pending_.reset();
            token_.reset();
            throw;
        }

        pending_.reset();
        Message res = [&] {
            try {
                return client_.exchange(methods::LoginTest, number, session, content_types::Bytes);
            }
            catch (...) {
                state_ = SessionState::Anonymous;
                throw;
            }
        }();

        if (res.isSuccess()) {
            state_ = SessionState::Authenticated;
            token_ = session;
            LOG_INFO("[AuthenticatedSession] logged in");
        }
        else {
            state_ = SessionState::Anonymous;
            token_.reset();
            LOG_INFO("[AuthenticatedSession] login rejected: " + res.bodyString());
        }
        return res;
    }

    Message AuthenticatedSession::loginTest(const std::vector<uint8_t>& challenge, const std::string& session) {
        std::scoped_lock lk(mtx_);
        return loginTestLocked(challenge, session);
    }

    Message AuthenticatedSession::login(const std::string& username) {
        std::scoped_lock lk(mtx_);
        Message challenge = loginRequestLocked(username);
        if (state_ != SessionState::AwaitingChallenge || !pending_)
            return challenge;
        const std::string session = *pending_;
        return loginTestLocked(challenge.body(), session);
    }

    void AuthenticatedSession::logout() {
        std::scoped_lock lk(mtx_);
        state_ = SessionState::Anonymous;
        pending_.reset();
        token_.reset();
    }

    SessionState AuthenticatedSession::state() const {
        std::scoped_lock lk(mtx_);
        return state_;
    }

    std::optional<std::string> AuthenticatedSession::sessionToken() const {
        std::scoped_lock lk(mtx_);
        return token_;
    }

    /*──────────────── vault operations ────────────────*/

    std::string AuthenticatedSession::requireAuthenticated(const char* operation) const {
        if (state_ != SessionState::Authenticated || !token_)
            throw SessionStateError(std::string(operation) + " requires a logged-in session (state: " +
                                    toString(state_) + ")");
        return *token_;
    }

    Message AuthenticatedSession::getSources() {
        std::scoped_lock lk(mtx_);
        return client_.exchange(methods::GetSources, {}, requireAuthenticated(methods::GetSources));
    }

    Message AuthenticatedSession::getSources(const std::string& session) {
        std::scoped_lock lk(mtx_);
        requireAuthenticated(methods::GetSources);
        return client_.exchange(methods::GetSources, {}, session);
    }

    Message AuthenticatedSession::getPassword(const std::string& source) {
        std::scoped_lock lk(mtx_);
        return client_.exchange(methods::GetPassword, bytesOf(source),
                                requireAuthenticated(methods::GetPassword), content_types::Ascii);
    }

    Message AuthenticatedSession::getPassword(const std::string& source, const std::string& session) {
        std::scoped_lock lk(mtx_);
        requireAuthenticated(methods::GetPassword);
        return client_.exchange(methods::GetPassword, bytesOf(source), session, content_types::Ascii);
    }

    Message AuthenticatedSession::setPassword(const std::string& source, const std::string& password) {
        std::string session;
        {
            std::scoped_lock lk(mtx_);
            session = requireAuthenticated(methods::SetPassword);
        }
        return setPassword(source, password, session);
    }

    Message AuthenticatedSession::setPassword(const std::string& source, const std::string& password,
                                              const std::string& session) {
        std::scoped_lock lk(mtx_);
        requireAuthenticated(methods::SetPassword);
        nlohmann::json body = {
            { "source",   source },
            { "password", base64Encode(keysLocked().encrypt(bytesOf(password))) }
        };
        return client_.exchange(methods::SetPassword, jsonBody(body), session, content_types::Json);
    }

    Message AuthenticatedSession::deletePassword(const std::string& source) {
        std::scoped_lock lk(mtx_);
        return client_.exchange(methods::DeletePassword, bytesOf(source),
                                requireAuthenticated(methods::DeletePassword), content_types::Ascii);
    }

    Message AuthenticatedSession::deletePassword(const std::string& source, const std::string& session) {
        std::scoped_lock lk(mtx_);
        requireAuthenticated(methods::DeletePassword);
        return client_.exchange(methods::DeletePassword, bytesOf(source), session, content_types::Ascii);
    }

    Message AuthenticatedSession::deleteUser() {
        std::string session;
        {
            std::scoped_lock lk(mtx_);
            session = requireAuthenticated(methods::DeleteUser);
        }
        return deleteUser(session);
    }

    Message AuthenticatedSession::deleteUser(const std::string& session) {
        std::scoped_lock lk(mtx_);
        requireAuthenticated(methods::DeleteUser);
        Message res = client_.exchange(methods::DeleteUser, {}, session);
        if (res.isSuccess()) {
            LOG_INFO("[AuthenticatedSession] account deleted");
            state_ = SessionState::Anonymous;
            token_.reset();
        }
        return res;
    }

    std::vector<std::string> AuthenticatedSession::parseSources(const std::string& body) {
        if (body.find_first_not_of(" \t\r\n") == std::string::npos)
            return {};

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::parse_error& e) {
            throw ProtocolError(std::string("get_sources body is not valid JSON: ") + e.what());
        }
        if (!j.is_array())
            throw ProtocolError("get_sources body is not a JSON array");

        std::vector<std::string> out;
        out.reserve(j.size());
        for (const auto& item : j) {
            if (!item.is_string())
                throw ProtocolError("get_sources entry is not a string");
            out.push_back(item.get<std::string>());
        }
        return out;
    }

}
