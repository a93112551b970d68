#include "json_util.hpp"

// header-only Boost.JSON, compiled into this translation unit only
#include <boost/json/src.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace JsonUtil {

boost::json::value parse(const std::string& text) {
    boost::json::error_code ec;
    boost::json::value jv = boost::json::parse(text, ec);
    if (ec) {
        throw std::invalid_argument("malformed json: " + ec.message());
    }
    return jv;
}

boost::json::value readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::invalid_argument("could not open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

const boost::json::object& asObject(const boost::json::value& v, const std::string& what) {
    if (!v.is_object()) {
        throw std::invalid_argument(what + " must be a json object");
    }
    return v.get_object();
}

const boost::json::value& field(const boost::json::object& obj, const std::string& key) {
    const boost::json::value* v = obj.if_contains(key);
    if (v == nullptr) {
        throw std::invalid_argument("missing key '" + key + "'");
    }
    return *v;
}

uint64_t toUint(const boost::json::value& v, const std::string& what) {
    // accept both signed and unsigned json integers as long as they're not negative
    if (v.is_uint64()) return v.get_uint64();
    if (v.is_int64() && v.get_int64() >= 0) return static_cast<uint64_t>(v.get_int64());
    throw std::invalid_argument("'" + what + "' must be a non-negative integer");
}

uint64_t getUint(const boost::json::object& obj, const std::string& key) {
    return toUint(field(obj, key), key);
}

double getDouble(const boost::json::object& obj, const std::string& key) {
    const boost::json::value& v = field(obj, key);
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    throw std::invalid_argument("'" + key + "' must be a number");
}

bool getBool(const boost::json::object& obj, const std::string& key) {
    const boost::json::value& v = field(obj, key);
    if (!v.is_bool()) {
        throw std::invalid_argument("'" + key + "' must be a boolean");
    }
    return v.get_bool();
}

std::string getString(const boost::json::object& obj, const std::string& key) {
    const boost::json::value& v = field(obj, key);
    if (!v.is_string()) {
        throw std::invalid_argument("'" + key + "' must be a string");
    }
    return std::string(v.get_string().c_str());
}

std::vector<uint64_t> getUintArray(const boost::json::object& obj, const std::string& key) {
    const boost::json::value& v = field(obj, key);
    if (!v.is_array()) {
        throw std::invalid_argument("'" + key + "' must be an array");
    }
    std::vector<uint64_t> out;
    out.reserve(v.get_array().size());
    for (const boost::json::value& item : v.get_array()) {
        out.push_back(toUint(item, key));
    }
    return out;
}

}
