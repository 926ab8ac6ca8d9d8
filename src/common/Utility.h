#pragma once

#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>

#include "StreamLogger.h"

namespace fs = boost::filesystem;

// Expand micro variable (microkey=microvalue)
#define __MICRO_KEY__(str) #str				  // No expand micro
#define __MICRO_VAR__(str) __MICRO_KEY__(str) // Expand micro

#define PRINT_VERSION()                                                                                                   \
	if (argc >= 2 && (std::string("version") == argv[1] || std::string("-v") == argv[1] || std::string("-V") == argv[1])) \
	{                                                                                                                     \
		std::cout << "Build: " << __MICRO_VAR__(BUILD_TAG) << std::endl;                                                  \
		return 0;                                                                                                         \
	}

// Get attribute from json Object
#define HAS_JSON_FIELD(jsonObj, key) (jsonObj.contains(key) && !jsonObj.at(key).is_null())
#define GET_JSON_STR_VALUE(jsonObj, key) Utility::stdStringTrim(HAS_JSON_FIELD(jsonObj, key) ? jsonObj.at(key).get<std::string>() : std::string(""))
#define SET_JSON_STR_VALUE(jsonObj, key, value) \
	if (HAS_JSON_FIELD(jsonObj, key))           \
		value = GET_JSON_STR_VALUE(jsonObj, key);
#define GET_JSON_INT_VALUE(jsonObj, key) (HAS_JSON_FIELD(jsonObj, key) ? jsonObj.at(key).get<int>() : 0)
#define SET_JSON_INT_VALUE(jsonObj, key, value) \
	if (HAS_JSON_FIELD(jsonObj, key))           \
		value = GET_JSON_INT_VALUE(jsonObj, key);

#define KILLTREE_CONFIG_JSON_FILE "killtree.json"
#define KILLTREE_LOG_DIR "log"
#define KILLTREE_LOGGER_NAME "killtree"
#define ENV_KILLTREE_PREFIX "KILLTREE_"
#define ENV_KILLTREE_LOG_LEVEL "KILLTREE_LogLevel"

// Returns the message of the last OS error of the calling thread.
const char *last_error_msg();

/// <summary>
/// All common functions
/// </summary>
class Utility
{
public:
	// OS related
	static const std::string getExecutablePath();
	static const std::string &getBinDir();
	static const std::string &getHomeDir();
	static bool isDirExist(const std::string &path);
	static bool isFileExist(const std::string &path);
	static bool createDirectory(const std::string &path);

	// String functions
	static bool isNumber(const std::string &str);
	static std::string stdStringTrim(const std::string &str);
	static std::vector<std::string> splitString(const std::string &source, const std::string &splitFlag);
	static bool startWith(const std::string &str, const std::string &prefix);
	static std::string stringReplace(const std::string &strBase, const std::string &strSrc, const std::string &strDst, int startPos = 0);
	static std::string stringFormat(const std::string fmt_str, ...);
	static std::string strToupper(std::string s);

	// Read file to string
	static std::string readFileCpp(const std::string &path);

	static std::string getenv(const std::string &envName, const std::string &defaultValue = "");

	static void initLogging(const std::string &name);
	static bool setLogLevel(const std::string &level);
};
