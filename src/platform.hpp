#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace verity::platform {

    /**
     * @brief Write side of one client connection. Frames are sent as single lines.
     */
    class Responder {
    public:
        virtual ~Responder() = default;

        /**
         * @brief Sends frame followed by '\n'.
         * @return false once the client is gone; later frames are dropped.
         */
        virtual bool send(const std::string& frame) = 0;
    };

    /**
     * @brief Abstract base class for the IPC server (The Bridge).
     * One request line per connection, answered by any number of frames.
     * Implementations will use Unix Domain Sockets (Linux) or Named Pipes (Windows).
     */
    class Bridge {
    public:
        using RequestHandler = std::function<void(const std::string& request, Responder& out)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket/pipe (e.g., "verity.sock").
         * @throws verity::Error (Connectivity)
         */
        virtual void listen(const std::string& name) = 0;

        virtual void set_handler(RequestHandler handler) = 0;

        /**
         * @brief Accept loop; each connection is served on its own thread.
         */
        virtual void run() = 0;

        /**
         * @brief Stops accepting and waits for open connections to finish.
         */
        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for IPC Client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @brief Connects to the IPC endpoint.
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends one request line.
         */
        virtual bool send(const std::string& message) = 0;

        /**
         * @brief Reads the next response frame. False at end of stream.
         */
        virtual bool read_frame(std::string& frame) = 0;

        static std::unique_ptr<Client> create();
    };

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        std::string socket_path(const std::string& name);
    }

}
