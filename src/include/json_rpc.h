/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_JSON_RPC_H
#define VIGIL_JSON_RPC_H

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::basic_json<nlohmann::ordered_map>;

namespace json_rpc {
    /**
     * Control channel method ids
     */
    enum MethodId {
        MID_UNKNOWN = -1,
        MID_PING    = 0
    };

    /**
     * JSON-RPC 2.0 message wrapper (control channel)
     */
    class JsonRpc {
    public:
        explicit JsonRpc(const json &data);
        explicit JsonRpc(const json &&data) = delete;
        ~JsonRpc() = default;
        JsonRpc(const JsonRpc &o) = delete;
        JsonRpc &operator=(const JsonRpc &o) = delete;

        /**
         * Verify request
         * @throw   std::invalid_argument   malformed request
         * @throw   std::range_error        method not supported
         */
        void verify();

        /**
         * Verify response
         * @param[in]   id      Expected request id
         * @throw   std::invalid_argument   malformed response or id mismatch
         */
        void verify_response(int id);

        const std::string &get_method() const;
        int get_method_id() const;
        static int get_method_id(const std::string &m);
        static const char *get_method_name(int id);
        int get_id() const;
        bool has_id() const;
        bool is_error() const;
        const json &get_result() const;

        // static methods
        static json gen_request(int method_id, int id);
        static json gen_err(const int code, const std::string &msg);
        static json gen_err(const int code,
                            const int id,
                            const std::string &msg);
        static json gen_response(int id);
        static json gen_response(int id, const json &result);

        // string constants
        static const char *JSON_RPC_;
        static const char *VERSION_;
        static const char *METHOD_;
        static const char *PARAMS_;
        static const char *RESULT_;
        static const char *ID_;
        static const char *ERROR_;
        static const char *CODE_;
        static const char *MESSAGE_;

    private:
        // json rpc 2.0 message
        const json &data_;
        // verified
        bool verified_ = false;
        bool has_id_ = false;
    };

} // namespace json_rpc

#endif /* ifndef VIGIL_JSON_RPC_H */
