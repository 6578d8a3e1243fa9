#include "../platform.hpp"
#include "engine/log.hpp"
#include "verity/error.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <list>
#include <mutex>
#include <thread>

namespace verity::platform {

    namespace {
        constexpr size_t kMaxRequestBytes = 1 << 20;

        class SocketResponder : public Responder {
        public:
            explicit SocketResponder(int fd) : m_fd(fd) {}

            bool send(const std::string& frame) override {
                if (m_broken) return false;
                std::string line = frame + "\n";
                const char* p = line.data();
                size_t left = line.size();
                while (left > 0) {
                    ssize_t n = ::send(m_fd, p, left, MSG_NOSIGNAL);
                    if (n < 0 && errno == EINTR) continue;
                    if (n <= 0) {
                        m_broken = true;
                        return false;
                    }
                    p += n;
                    left -= static_cast<size_t>(n);
                }
                return true;
            }

        private:
            int m_fd;
            bool m_broken = false;
        };
    }

    class LinuxBridge : public Bridge {
    public:
        LinuxBridge() = default;
        ~LinuxBridge() { stop(); }

        void listen(const std::string& name) override {
            m_socket_path = system::socket_path(name);
            unlink(m_socket_path.c_str());

            m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_server_fd < 0) {
                throw Error(ErrorKind::Connectivity, std::string("socket: ") + strerror(errno));
            }

            struct sockaddr_un addr;
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            strncpy(addr.sun_path, m_socket_path.c_str(), sizeof(addr.sun_path) - 1);

            if (bind(m_server_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(m_server_fd, 16) < 0) {
                std::string msg = strerror(errno);
                close(m_server_fd);
                m_server_fd = -1;
                throw Error(ErrorKind::Connectivity, "cannot listen on " + m_socket_path + ": " + msg);
            }

            log::info("Bridge", "Listening on " + m_socket_path);
        }

        void set_handler(RequestHandler handler) override {
            m_handler = std::move(handler);
        }

        void run() override {
            if (m_server_fd < 0) return;
            m_running = true;

            struct pollfd pfd = { m_server_fd, POLLIN, 0 };

            while (m_running) {
                reap(false);
                int poll_num = poll(&pfd, 1, 500);
                if (poll_num > 0 && (pfd.revents & POLLIN)) {
                    int client_fd = accept(m_server_fd, nullptr, nullptr);
                    if (client_fd >= 0) {
                        spawn(client_fd);
                    }
                }
            }
        }

        void stop() override {
            m_running = false;
            if (m_server_fd >= 0) {
                close(m_server_fd);
                unlink(m_socket_path.c_str());
                m_server_fd = -1;
            }
            reap(true);
        }

    private:
        struct Connection {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        int m_server_fd = -1;
        std::string m_socket_path;
        RequestHandler m_handler;
        std::atomic<bool> m_running{false};
        std::list<Connection> m_connections;
        std::mutex m_connections_mutex;

        void spawn(int client_fd) {
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(m_connections_mutex);
            m_connections.push_back({std::thread([this, client_fd, done]() {
                handle_client(client_fd);
                *done = true;
            }), done});
        }

        void reap(bool all) {
            std::lock_guard<std::mutex> lock(m_connections_mutex);
            for (auto it = m_connections.begin(); it != m_connections.end();) {
                if (all || *it->done) {
                    if (it->thread.joinable()) it->thread.join();
                    it = m_connections.erase(it);
                } else {
                    ++it;
                }
            }
        }

        void handle_client(int client_fd) {
            std::string request;
            char buffer[4096];
            while (request.size() < kMaxRequestBytes) {
                ssize_t len = read(client_fd, buffer, sizeof(buffer));
                if (len < 0 && errno == EINTR) continue;
                if (len <= 0) break;
                request.append(buffer, static_cast<size_t>(len));
                if (request.find('\n') != std::string::npos) break;
            }
            auto nl = request.find('\n');
            if (nl != std::string::npos) request.resize(nl);

            SocketResponder out(client_fd);
            if (!request.empty()) {
                try {
                    if (m_handler) m_handler(request, out);
                    else out.send("{}");
                } catch (const std::exception& e) {
                    log::error("Bridge", std::string("Handler failed: ") + e.what());
                }
            }
            close(client_fd);
        }
    };

    class LinuxClient : public Client {
    public:
        bool connect(const std::string& name) override {
            m_socket_path = system::socket_path(name);
            m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_fd < 0) return false;

            struct sockaddr_un addr;
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            strncpy(addr.sun_path, m_socket_path.c_str(), sizeof(addr.sun_path) - 1);

            if (::connect(m_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
                close(m_fd);
                m_fd = -1;
                return false;
            }
            return true;
        }

        bool send(const std::string& message) override {
            if (m_fd < 0) return false;
            std::string line = message + "\n";
            const char* p = line.data();
            size_t left = line.size();
            while (left > 0) {
                ssize_t n = ::send(m_fd, p, left, MSG_NOSIGNAL);
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) return false;
                p += n;
                left -= static_cast<size_t>(n);
            }
            return true;
        }

        bool read_frame(std::string& frame) override {
            while (true) {
                auto nl = m_pending.find('\n');
                if (nl != std::string::npos) {
                    frame = m_pending.substr(0, nl);
                    m_pending.erase(0, nl + 1);
                    return true;
                }
                if (m_fd < 0) break;
                char buffer[4096];
                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len < 0 && errno == EINTR) continue;
                if (len <= 0) break;
                m_pending.append(buffer, static_cast<size_t>(len));
            }
            if (m_pending.empty()) return false;
            frame = std::move(m_pending);
            m_pending.clear();
            return true;
        }

        ~LinuxClient() {
            if (m_fd >= 0) close(m_fd);
        }

    private:
        int m_fd = -1;
        std::string m_socket_path;
        std::string m_pending;
    };

    // Factory implementations
    std::unique_ptr<Bridge> Bridge::create() {
        return std::make_unique<LinuxBridge>();
    }

    std::unique_ptr<Client> Client::create() {
        return std::make_unique<LinuxClient>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/verity" : "";
        }
        std::filesystem::path get_data_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".local/share/verity" : "";
        }
        std::string socket_path(const std::string& name) {
            return "/tmp/" + name;
        }
    }

}
