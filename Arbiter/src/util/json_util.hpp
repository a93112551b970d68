#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

/*
 Small helpers around Boost.JSON shared by every loader.
 Every getter throws std::invalid_argument naming the offending key, loaders
 rethrow it as their own error type with the file path attached.
*/
namespace JsonUtil {

// parses text, throws std::invalid_argument with the parser's message
boost::json::value parse(const std::string& text);

// reads and parses a whole file, throws std::invalid_argument if it can't be opened
boost::json::value readFile(const std::string& path);

const boost::json::object& asObject(const boost::json::value& v, const std::string& what);
const boost::json::value& field(const boost::json::object& obj, const std::string& key);

uint64_t getUint(const boost::json::object& obj, const std::string& key);
double getDouble(const boost::json::object& obj, const std::string& key);
bool getBool(const boost::json::object& obj, const std::string& key);
std::string getString(const boost::json::object& obj, const std::string& key);
std::vector<uint64_t> getUintArray(const boost::json::object& obj, const std::string& key);

uint64_t toUint(const boost::json::value& v, const std::string& what);

}
