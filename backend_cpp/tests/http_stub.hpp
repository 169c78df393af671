#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace merlt::fakes {

// Minimal HTTP/1.1 responder on 127.0.0.1 for the provider client tests.
// One connection at a time; every response closes the connection.
class LocalHttpStub {
public:
    struct Request {
        std::string method;
        std::string path;
        std::string authorization;
        std::string body;
    };
    using Handler = std::function<std::pair<int, std::string>(const Request&)>;

    explicit LocalHttpStub(Handler handler) : handler_(std::move(handler)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("stub: socket() failed");
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 16) != 0) {
            ::close(fd_);
            throw std::runtime_error("stub: cannot listen on loopback");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serve(); });
    }

    ~LocalHttpStub() {
        ::shutdown(fd_, SHUT_RDWR);
        thread_.join();
        ::close(fd_);
    }

    LocalHttpStub(const LocalHttpStub&) = delete;
    LocalHttpStub& operator=(const LocalHttpStub&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

    // Polls until `n` requests arrived or `timeout` passed.
    bool wait_for(size_t n, std::chrono::milliseconds timeout) const {
        auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            if (requests().size() >= n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return requests().size() >= n;
    }

private:
    void serve() {
        while (true) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;   // listening socket shut down
            handle(client);
            ::close(client);
        }
    }

    static std::string header(const std::string& lowered_head, const std::string& head, const std::string& name) {
        auto pos = lowered_head.find("\r\n" + name + ":");
        if (pos == std::string::npos) return "";
        auto start = pos + name.size() + 3;
        auto end = head.find("\r\n", start);
        std::string value = head.substr(start, end - start);
        value.erase(0, value.find_first_not_of(' '));
        return value;
    }

    void send_all(int client, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(client, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    void handle(int client) {
        std::string data;
        char buf[4096];
        size_t head_end = std::string::npos;
        while (head_end == std::string::npos) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) return;
            data.append(buf, static_cast<size_t>(n));
            head_end = data.find("\r\n\r\n");
        }

        std::string head = data.substr(0, head_end);
        std::string lowered = head;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        Request req;
        auto sp1 = head.find(' ');
        auto sp2 = head.find(' ', sp1 + 1);
        req.method = head.substr(0, sp1);
        req.path = head.substr(sp1 + 1, sp2 - sp1 - 1);
        req.authorization = header(lowered, head, "authorization");

        size_t length = 0;
        auto cl = header(lowered, head, "content-length");
        if (!cl.empty()) length = static_cast<size_t>(std::stoul(cl));
        if (lowered.find("expect: 100-continue") != std::string::npos) {
            send_all(client, "HTTP/1.1 100 Continue\r\n\r\n");
        }

        std::string body = data.substr(head_end + 4);
        while (body.size() < length) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            body.append(buf, static_cast<size_t>(n));
        }
        req.body = body.substr(0, length);

        {
            std::lock_guard<std::mutex> lock(mtx_);
            requests_.push_back(req);
        }
        auto [status, payload] = handler_(req);
        send_all(client, "HTTP/1.1 " + std::to_string(status) + " Stub\r\n"
                         "Content-Type: application/json\r\n"
                         "Content-Length: " + std::to_string(payload.size()) + "\r\n"
                         "Connection: close\r\n\r\n" + payload);
    }

    Handler handler_;
    int fd_ = -1;
    unsigned short port_ = 0;
    std::thread thread_;
    std::vector<Request> requests_;
    mutable std::mutex mtx_;
};

} // namespace merlt::fakes
