/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <json_rpc.h>
#include <algorithm>
#include <map>
#include <stdexcept>

// supported control channel methods
static const std::map<int, std::string> ControlMethodMap = {
    {json_rpc::MID_PING, "ping"}
};

// static members
const char *json_rpc::JsonRpc::JSON_RPC_            = "jsonrpc";
const char *json_rpc::JsonRpc::VERSION_             = "2.0";
const char *json_rpc::JsonRpc::METHOD_              = "method";
const char *json_rpc::JsonRpc::PARAMS_              = "params";
const char *json_rpc::JsonRpc::RESULT_              = "result";
const char *json_rpc::JsonRpc::ID_                  = "id";
const char *json_rpc::JsonRpc::ERROR_               = "error";
const char *json_rpc::JsonRpc::CODE_                = "code";
const char *json_rpc::JsonRpc::MESSAGE_             = "message";

json_rpc::JsonRpc::JsonRpc(const json &data) : data_(data){

}

json json_rpc::JsonRpc::gen_request(int method_id, int id){
    const char *m = get_method_name(method_id);
    if (m == nullptr)
        throw std::range_error("method not supported");

    json j;
    j[JSON_RPC_] = VERSION_;
    j[METHOD_] = m;
    j[PARAMS_] = json::object();
    j[ID_] = id;
    return j;
}

json json_rpc::JsonRpc::gen_err(const int code, const std::string &msg){
    json j;
    j[JSON_RPC_] = VERSION_;
    j[ERROR_][CODE_] = code;
    j[ERROR_][MESSAGE_] = msg;
    j[ID_] = nullptr;
    return j;
}

json json_rpc::JsonRpc::gen_err(const int code,
                                const int id,
                                const std::string &msg) {
    json j;
    j[JSON_RPC_] = VERSION_;
    j[ERROR_][CODE_] = code;
    j[ERROR_][MESSAGE_] = msg;
    j[ID_] = id;
    return j;
}

json json_rpc::JsonRpc::gen_response(int id){
    return gen_response(id, true);
}

json json_rpc::JsonRpc::gen_response(int id, const json &result){
    json j;
    j[JSON_RPC_] = VERSION_;
    j[RESULT_] = result;
    j[ID_] = id;
    return j;
}

const char *json_rpc::JsonRpc::get_method_name(int id){
    auto it = ControlMethodMap.find(id);
    if (it == ControlMethodMap.cend())
        return nullptr;
    return it->second.c_str();
}

int json_rpc::JsonRpc::get_method_id(const std::string &m){
    auto it = std::find_if(ControlMethodMap.cbegin(),
                           ControlMethodMap.cend(),
                           [&m](const std::pair<const int, std::string> &p) {
                               return p.second == m;
                           });
    if (it == ControlMethodMap.cend())
        return MID_UNKNOWN;
    else
        return it->first;
}

int json_rpc::JsonRpc::get_method_id() const {
    return get_method_id(get_method());
}

const std::string &json_rpc::JsonRpc::get_method() const {
    if (!verified_)
        throw std::invalid_argument("unverified");

    return data_.at(METHOD_).get_ref<const json::string_t&>();
}

const json &json_rpc::JsonRpc::get_result() const {
    if (!verified_)
        throw std::invalid_argument("unverified");

    return data_.at(RESULT_);
}

static bool validate_id(const json &d){
    // id (optional)
    if (d.contains(json_rpc::JsonRpc::ID_)) {
        const json &j_id = d.at(json_rpc::JsonRpc::ID_);
        if (!(j_id.is_string() || j_id.is_number_integer()))
            throw std::invalid_argument("id != string | integer");

        return true;
    }
    return false;
}

int json_rpc::JsonRpc::get_id() const {
    if (!verified_)
        throw std::invalid_argument("unverified");

    // get ID (string or int)
    // this will throw in case of a missing ID field
    const json &j_id = data_.at(ID_);
    if (j_id.is_string())
        return std::stoi(j_id.get<std::string>());
    else
        return j_id.get<int>();
}

bool json_rpc::JsonRpc::has_id() const {
    return has_id_;
}

bool json_rpc::JsonRpc::is_error() const {
    return data_.is_object() && data_.contains(ERROR_);
}

void json_rpc::JsonRpc::verify(){
    if (!data_.is_object())
        throw std::invalid_argument("request != object");

    // version
    const json &j_ver = data_.at(JSON_RPC_);
    if (!(j_ver.is_string() && j_ver == VERSION_))
        throw std::invalid_argument("jsonrpc != 2.0");

    // method
    const json &j_method = data_.at(METHOD_);
    if (!j_method.is_string())
        throw std::invalid_argument("method != string");

    // params (optional)
    auto it = data_.find(PARAMS_);
    if (it != data_.end() && !((*it).is_array() || (*it).is_object()))
        throw std::invalid_argument("params != object | array");

    // id (optional)
    has_id_ = validate_id(data_);

    // verify method
    if (get_method_id(j_method.get_ref<const json::string_t &>()) == MID_UNKNOWN)
        throw std::range_error("method not supported");

    // rpc verified
    verified_ = true;
}

void json_rpc::JsonRpc::verify_response(int id){
    if (!data_.is_object())
        throw std::invalid_argument("response != object");

    // version
    auto it = data_.find(JSON_RPC_);
    if (it == data_.end() || !((*it).is_string() && *it == VERSION_))
        throw std::invalid_argument("jsonrpc != 2.0");

    // error object
    if (is_error())
        throw std::invalid_argument("error response");

    // result
    if (!data_.contains(RESULT_))
        throw std::invalid_argument("missing result");

    // id
    has_id_ = validate_id(data_);
    if (!has_id_)
        throw std::invalid_argument("missing id");

    // requests are always sent with numeric ids
    const json &j_id = data_.at(ID_);
    if (!j_id.is_number_integer() || j_id.get<int64_t>() != id)
        throw std::invalid_argument("id mismatch");

    verified_ = true;
}
