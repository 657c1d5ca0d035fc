/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <ping.h>
#include <daemon.h>
#include <json_rpc.h>
#include <vigil_err_codes.h>
#include <unistd.h>
#include <istream>
#include <boost/asio.hpp>

namespace asio = boost::asio;
using boost::system::error_code;
using local_stream = asio::local::stream_protocol;

const char *vigil::ping_result_str(PingResult res) {
    switch (res) {
        case PR_ALIVE:
            return "alive";
        case PR_TIMEOUT:
            return "timeout";
        case PR_CHANNEL_ERROR:
            return "channel error";
        default:
            return "unknown";
    }
}

/*******************/
/* ping (client)   */
/*******************/
vigil::PingResult vigil::LocalPingChannel::ping(const std::string &endpoint,
                                                std::chrono::milliseconds timeout) {
    const int id = next_id.fetch_add(1);
    std::string req;
    try {
        req = json_rpc::JsonRpc::gen_request(json_rpc::MID_PING, id).dump();
        req.push_back('\n');
    } catch (std::exception &e) {
        vigil::log(LLT_ERROR, "cannot create ping request: %s", e.what());
        return PR_CHANNEL_ERROR;
    }

    asio::io_context ioc;
    local_stream::socket s(ioc);
    asio::streambuf rbuf;
    bool done = false;
    error_code res_ec;

    try {
        local_stream::endpoint ep(endpoint);
        // connect -> write -> read reply line
        s.async_connect(ep, [&](const error_code &ec) {
            if (ec) {
                res_ec = ec;
                done = true;
                return;
            }
            asio::async_write(s, asio::buffer(req), [&](const error_code &wec, std::size_t) {
                if (wec) {
                    res_ec = wec;
                    done = true;
                    return;
                }
                asio::async_read_until(s, rbuf, '\n', [&](const error_code &rec, std::size_t) {
                    res_ec = rec;
                    done = true;
                });
            });
        });
        ioc.run_for(timeout);

    } catch (std::exception &e) {
        vigil::log(LLT_DEBUG, "ping [%s] failed: %s", endpoint.c_str(), e.what());
        return PR_CHANNEL_ERROR;
    }

    // no reply in time
    if (!done) {
        error_code cec;
        s.close(cec);
        return PR_TIMEOUT;
    }

    // connection refused, missing socket, peer closed...
    if (res_ec) {
        vigil::log(LLT_DEBUG,
                   "ping [%s] channel error: %s",
                   endpoint.c_str(),
                   res_ec.message().c_str());
        return PR_CHANNEL_ERROR;
    }

    // verify acknowledgement
    std::istream is(&rbuf);
    std::string line;
    std::getline(is, line);
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) return PR_CHANNEL_ERROR;

    try {
        json_rpc::JsonRpc rpc(j);
        rpc.verify_response(id);
        if (rpc.get_result() != true) return PR_CHANNEL_ERROR;

    } catch (std::exception &e) {
        vigil::log(LLT_DEBUG,
                   "ping [%s] invalid reply: %s",
                   endpoint.c_str(),
                   e.what());
        return PR_CHANNEL_ERROR;
    }

    return PR_ALIVE;
}

/**********************/
/* responder session  */
/**********************/
class vigil::PingResponder::Session : public std::enable_shared_from_this<Session> {
public:
    Session(local_stream::socket _sock, PingResponder *_resp)
        : sock(std::move(_sock)),
          resp(_resp) {}

    void start() { do_read(); }

private:
    void do_read() {
        auto self = shared_from_this();
        asio::async_read_until(sock, buf, '\n', [this, self](const error_code &ec, std::size_t) {
            // peer closed or error
            if (ec) return;

            std::istream is(&buf);
            std::string line;
            std::getline(is, line);

            // hung daemon simulation, swallow request
            if (!resp->replying.load()) {
                do_read();
                return;
            }

            std::string reply;
            if (!PingResponder::process_request(line, reply)) {
                do_read();
                return;
            }
            out = reply;
            out.push_back('\n');
            asio::async_write(sock, asio::buffer(out), [this, self](const error_code &wec, std::size_t) {
                if (wec) return;
                resp->answered.fetch_add(1);
                do_read();
            });
        });
    }

    local_stream::socket sock;
    asio::streambuf buf;
    std::string out;
    PingResponder *resp;
};

/*********************/
/* responder         */
/*********************/
vigil::PingResponder::PingResponder(const std::string &_path) : path(_path),
                                                                acceptor(ioc) {

}

vigil::PingResponder::~PingResponder() {
    stop();
}

bool vigil::PingResponder::process_request(const std::string &line, std::string &reply) {
    using json_rpc::JsonRpc;
    namespace err = vigil::error;

    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        reply = JsonRpc::gen_err(err::EC_JSON_MALFORMED, "parse error").dump();
        return true;
    }

    JsonRpc rpc(j);
    try {
        rpc.verify();

    } catch (std::range_error &e) {
        // unsupported method
        if (j.contains(JsonRpc::ID_) && j[JsonRpc::ID_].is_number_integer())
            reply = JsonRpc::gen_err(err::EC_METHOD_NOT_FOUND,
                                     j[JsonRpc::ID_].get<int>(),
                                     e.what()).dump();
        else
            reply = JsonRpc::gen_err(err::EC_METHOD_NOT_FOUND, e.what()).dump();
        return true;

    } catch (std::exception &e) {
        reply = JsonRpc::gen_err(err::EC_INVALID_REQUEST, e.what()).dump();
        return true;
    }

    // notifications are not answered
    if (!rpc.has_id()) return false;

    try {
        switch (rpc.get_method_id()) {
            case json_rpc::MID_PING:
                reply = JsonRpc::gen_response(rpc.get_id()).dump();
                return true;

            default:
                reply = JsonRpc::gen_err(err::EC_METHOD_NOT_FOUND,
                                         rpc.get_id(),
                                         "method not supported").dump();
                return true;
        }
    } catch (std::exception &e) {
        reply = JsonRpc::gen_err(err::EC_INVALID_REQUEST, e.what()).dump();
        return true;
    }
}

void vigil::PingResponder::do_accept() {
    acceptor.async_accept([this](const error_code &ec, local_stream::socket sock) {
        if (!ec) std::make_shared<Session>(std::move(sock), this)->start();
        if (acceptor.is_open()) do_accept();
    });
}

int vigil::PingResponder::start() {
    if (running) return 0;

    try {
        // remove stale socket file
        ::unlink(path.c_str());
        local_stream::endpoint ep(path);
        acceptor.open(ep.protocol());
        acceptor.bind(ep);
        acceptor.listen();

    } catch (std::exception &e) {
        vigil::log(LLT_ERROR,
                   "cannot listen on control socket [%s]: %s",
                   path.c_str(),
                   e.what());
        error_code ec;
        acceptor.close(ec);
        return 1;
    }

    do_accept();
    ioc.restart();
    th = std::thread([this] { ioc.run(); });
    running = true;
    return 0;
}

void vigil::PingResponder::stop() {
    if (!running) return;

    ioc.stop();
    if (th.joinable()) th.join();
    error_code ec;
    acceptor.close(ec);
    ::unlink(path.c_str());
    running = false;
}

void vigil::PingResponder::set_replying(bool _replying) {
    replying.store(_replying);
}

uint64_t vigil::PingResponder::get_answered() const {
    return answered.load();
}
