#include "wireguard_backend.hpp"
#include "../utils/logger.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

constexpr size_t KEY_SIZE = 32;
constexpr size_t ENCODED_KEY_SIZE = 44;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

std::string openssl_error(const char* what) {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(what) + ": " + buf;
}

std::string encode_key(const std::array<unsigned char, KEY_SIZE>& raw) {
    std::array<unsigned char, ENCODED_KEY_SIZE + 1> out{};
    int len = EVP_EncodeBlock(out.data(), raw.data(), static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

} // namespace

WireGuardBackend::WireGuardBackend(const std::string& interface_name, const std::string& wg_binary)
    : interface_name_(interface_name), wg_binary_(wg_binary) {}

KeyPair WireGuardBackend::generate_key_pair() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw std::runtime_error(openssl_error("X25519 keygen init failed"));
    }

    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw_key) <= 0) {
        throw std::runtime_error(openssl_error("X25519 keygen failed"));
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(raw_key);

    std::array<unsigned char, KEY_SIZE> private_raw{};
    std::array<unsigned char, KEY_SIZE> public_raw{};
    size_t private_len = private_raw.size();
    size_t public_len = public_raw.size();
    if (EVP_PKEY_get_raw_private_key(key.get(), private_raw.data(), &private_len) <= 0 ||
        EVP_PKEY_get_raw_public_key(key.get(), public_raw.data(), &public_len) <= 0 ||
        private_len != KEY_SIZE || public_len != KEY_SIZE) {
        throw std::runtime_error(openssl_error("X25519 key export failed"));
    }

    KeyPair pair{encode_key(private_raw), encode_key(public_raw)};
    OPENSSL_cleanse(private_raw.data(), private_raw.size());
    return pair;
}

void WireGuardBackend::register_peer(const std::string& public_key, const std::string& allowed_ip) {
    if (!is_valid_key(public_key)) {
        throw std::invalid_argument("malformed WireGuard public key");
    }
    run_wg({"set", interface_name_, "peer", public_key, "allowed-ips", allowed_ip + "/32"});
    LOG_DEBUG("wg: added peer " << public_key << " allowed-ips " << allowed_ip << "/32 on " << interface_name_);
}

void WireGuardBackend::deregister_peer(const std::string& public_key) {
    run_wg({"set", interface_name_, "peer", public_key, "remove"});
    LOG_DEBUG("wg: removed peer " << public_key << " from " << interface_name_);
}

bool WireGuardBackend::is_valid_key(std::string_view key) {
    if (key.size() != ENCODED_KEY_SIZE || key.back() != '=') {
        return false;
    }
    for (size_t i = 0; i + 1 < key.size(); ++i) {
        char c = key[i];
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!ok) {
            return false;
        }
    }
    return true;
}

void WireGuardBackend::run_wg(const std::vector<std::string>& args) const {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(wg_binary_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, wg_binary_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(err_pipe[1]);

    if (rc != 0) {
        close(err_pipe[0]);
        throw std::runtime_error("failed to run " + wg_binary_ + ": " + std::strerror(rc));
    }

    std::string err_output;
    char buf[256];
    for (;;) {
        ssize_t n = read(err_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            err_output.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        while (!err_output.empty() && (err_output.back() == '\n' || err_output.back() == '\r')) {
            err_output.pop_back();
        }
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw std::runtime_error(wg_binary_ + " " + args.front() + " exited with " +
                                 std::to_string(code) +
                                 (err_output.empty() ? "" : ": " + err_output));
    }
}
