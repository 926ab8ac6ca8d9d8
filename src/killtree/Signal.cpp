#include <map>
#include <stdexcept>

#include "../common/Utility.h"
#include "Signal.h"

namespace killtree
{
	namespace
	{
		const std::map<std::string, int> &signalTable()
		{
			static const std::map<std::string, int> table = {
				{"HUP", SIGHUP},
				{"INT", SIGINT},
				{"QUIT", SIGQUIT},
				{"KILL", SIGKILL},
				{"USR1", SIGUSR1},
				{"USR2", SIGUSR2},
				{"TERM", SIGTERM}};
			return table;
		}
	}

	int parseSignal(const std::string &signal)
	{
		const auto value = Utility::strToupper(Utility::stdStringTrim(signal));
		if (Utility::isNumber(value))
		{
			const int number = std::stoi(value);
			if (number <= 0)
			{
				throw std::invalid_argument(Utility::stringFormat("invalid signal number <%s>", signal.c_str()));
			}
			return number;
		}

		const auto name = Utility::startWith(value, "SIG") ? value.substr(3) : value;
		const auto iter = signalTable().find(name);
		if (iter == signalTable().end())
		{
			throw std::invalid_argument(Utility::stringFormat("unknown signal <%s>", signal.c_str()));
		}
		return iter->second;
	}

	std::string signalName(int signal)
	{
		for (const auto &entry : signalTable())
		{
			if (entry.second == signal)
			{
				return "SIG" + entry.first;
			}
		}
		return std::to_string(signal);
	}

} // namespace killtree
