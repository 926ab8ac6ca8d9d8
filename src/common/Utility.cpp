#include <algorithm>
#include <cstdarg>
#include <fstream>
#include <string>
#include <vector>

#include <limits.h>
#if defined(__APPLE__)
#include <mach-o/dyld.h> // For _NSGetExecutablePath
#elif defined(_WIN32)
#include <windows.h>
#endif

#include <ace/OS.h>
#include <boost/filesystem.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "Utility.h"

const std::string Utility::getExecutablePath()
{
	const static char fname[] = "Utility::getExecutablePath() ";
#if defined(_WIN32)
	char buf[MAX_PATH] = {0};
	DWORD len = ::GetModuleFileNameA(NULL, buf, MAX_PATH);
	if (len == 0 || len >= MAX_PATH)
	{
		LOG_ERR << fname << "Failed to retrieve executable path: " << ::GetLastError();
		return "";
	}
	return fs::path(buf).string();

#elif defined(__linux__)
	char buf[PATH_MAX] = {0};
	auto count = ACE_OS::readlink("/proc/self/exe", buf, PATH_MAX);
	if (count < 0 || count >= PATH_MAX)
	{
		LOG_ERR << fname << "Failed to read /proc/self/exe: " << last_error_msg();
		return "";
	}
	buf[count] = '\0';
	return buf;

#elif defined(__APPLE__)
	std::vector<char> buf(PATH_MAX);
	uint32_t size = buf.size();
	if (_NSGetExecutablePath(buf.data(), &size) != 0)
	{
		LOG_ERR << fname << "Failed to retrieve executable path";
		return "";
	}

	char realPath[PATH_MAX] = {0};
	if (realpath(buf.data(), realPath) == nullptr)
	{
		LOG_ERR << fname << "Failed to resolve real path: " << last_error_msg();
		return "";
	}
	return realPath;

#else
	LOG_ERR << fname << "Platform not supported";
	return "";
#endif
}

const std::string &Utility::getBinDir()
{
	static const std::string selfBinDir = fs::path(getExecutablePath()).parent_path().string();
	return selfBinDir;
}

const std::string &Utility::getHomeDir()
{
	static const std::string homeDir = fs::path(getBinDir()).parent_path().string();
	return homeDir;
}

bool Utility::isDirExist(const std::string &path)
{
	boost::system::error_code ec;
	return fs::exists(path, ec) && fs::is_directory(path, ec);
}

bool Utility::isFileExist(const std::string &path)
{
	boost::system::error_code ec;
	return fs::exists(path, ec) && !fs::is_directory(path, ec);
}

bool Utility::createDirectory(const std::string &path)
{
	const static char fname[] = "Utility::createDirectory() ";

	if (!isDirExist(path))
	{
		boost::system::error_code ec;
		if (!fs::create_directories(fs::path(path), ec))
		{
			LOG_ERR << fname << "Create directory <" << path << "> failed with error: " << ec.message();
			return false;
		}
		LOG_DBG << fname << "Created directory: " << path;
	}
	return true;
}

bool Utility::isNumber(const std::string &str)
{
	if (str.empty())
		return false;

	size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
	if (start == 1 && str.size() == 1)
		return false;

	return std::all_of(str.begin() + start, str.end(), ::isdigit);
}

std::string Utility::stdStringTrim(const std::string &str)
{
	auto front = std::find_if_not(str.begin(), str.end(), [](int c)
								  { return std::isspace(c); });
	auto back = std::find_if_not(str.rbegin(), str.rend(), [](int c)
								 { return std::isspace(c); })
					.base();
	return (back <= front ? std::string() : std::string(front, back));
}

std::vector<std::string> Utility::splitString(const std::string &source, const std::string &splitFlag)
{
	std::vector<std::string> result;
	std::string::size_type pos1 = 0;
	std::string::size_type pos2 = source.find(splitFlag);
	while (std::string::npos != pos2)
	{
		std::string str = stdStringTrim(source.substr(pos1, pos2 - pos1));
		if (str.length() > 0)
			result.push_back(str);

		pos1 = pos2 + splitFlag.size();
		pos2 = source.find(splitFlag, pos1);
	}
	if (pos1 < source.length())
	{
		std::string str = stdStringTrim(source.substr(pos1));
		if (!str.empty())
			result.push_back(std::move(str));
	}
	return result;
}

bool Utility::startWith(const std::string &str, const std::string &prefix)
{
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string Utility::stringReplace(const std::string &strBase, const std::string &strSrc, const std::string &strDst, int startPos)
{
	std::string str = strBase;
	std::string::size_type position = startPos;
	const std::string::size_type srcLen = strSrc.size();
	const std::string::size_type dstLen = strDst.size();

	while (srcLen && (position = str.find(strSrc, position)) != std::string::npos)
	{
		str.replace(position, srcLen, strDst);
		position += dstLen;
	}
	return str;
}

std::string Utility::stringFormat(const std::string fmt_str, ...)
{
	int final_n, n = ((int)fmt_str.size()) * 2; /* Reserve two times as much as the length of the fmt_str */
	std::unique_ptr<char[]> formatted;
	va_list ap;
	while (true)
	{
		formatted.reset(new char[n]);
		va_start(ap, fmt_str);
		final_n = vsnprintf(&formatted[0], n, fmt_str.c_str(), ap);
		va_end(ap);
		if (final_n < 0 || final_n >= n)
			n += abs(final_n - n + 1);
		else
			break;
	}
	return std::string(formatted.get());
}

std::string Utility::strToupper(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
				   { return std::toupper(c); });
	return s;
}

std::string Utility::readFileCpp(const std::string &path)
{
	const static char fname[] = "Utility::readFileCpp() ";

	std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
	if (!file)
	{
		LOG_WAR << fname << "Cannot open file <" << path << ">";
		return std::string();
	}

	std::string content;
	content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	return content;
}

std::string Utility::getenv(const std::string &envName, const std::string &defaultValue)
{
	const char *val = ACE_OS::getenv(envName.data());
	if (val == nullptr || val[0] == '\0')
		return defaultValue;

	return val;
}

void Utility::initLogging(const std::string &name)
{
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

	// Rotating file sink
	if (!name.empty())
	{
		const auto logDir = (fs::path(Utility::getHomeDir()) / KILLTREE_LOG_DIR).string();
		if (Utility::createDirectory(logDir))
		{
			constexpr size_t maxFileSize = 10 * 1024 * 1024; // 10MB
			constexpr size_t maxFiles = 3;
			const auto logPath = (fs::path(logDir) / name).string() + ".log";
			sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, maxFileSize, maxFiles, false));
		}
	}

	auto logger = std::make_shared<spdlog::logger>(KILLTREE_LOGGER_NAME, sinks.begin(), sinks.end());
	spdlog::set_default_logger(logger);
	spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] %l: %v");
	spdlog::set_level(spdlog::level::info);

	auto levelEnv = Utility::getenv(ENV_KILLTREE_LOG_LEVEL);
	if (!levelEnv.empty())
		setLogLevel(levelEnv);

	LOG_DBG << "Logging process ID:" << ACE_OS::getpid();
}

bool Utility::setLogLevel(const std::string &level)
{
	static const std::map<std::string, spdlog::level::level_enum> levelMap =
		{
			{"NOTSET", spdlog::level::off},
			{"DEBUG", spdlog::level::debug},
			{"INFO", spdlog::level::info},
			{"WARN", spdlog::level::warn},
			{"ERROR", spdlog::level::err},
			{"CRIT", spdlog::level::critical},
			{"FATAL", spdlog::level::critical}};

	auto it = levelMap.find(Utility::strToupper(level));
	if (it != levelMap.end())
	{
		spdlog::set_level(it->second);
		LOG_DBG << "Setting log level to " << level;
		return true;
	}
	LOG_ERR << "No such log level " << level;
	return false;
}

static thread_local std::string g_errorMessage;

const char *last_error_msg()
{
	const int errorCode = ACE_OS::last_error();
	const char *errorMessage = ACE_OS::strerror(errorCode);
	if (errorMessage && *errorMessage)
	{
		g_errorMessage.assign(errorMessage);
	}
	else
	{
		g_errorMessage.assign("Unknown error");
	}
	return g_errorMessage.c_str();
}
