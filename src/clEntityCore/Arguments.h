
//
// ===============================================================================
// clEntity, Arguments.h - Basic command-line parsing.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include <cstdlib>
#include <string>
#include <vector>


//
// Very simple command-line argument storage and query. Flags start with '-' and every
// flag, apart from those named as switches, consumes the argument after it as its value.
//
struct Arguments
{
	static const size_t NOT_FOUND = (size_t)-1;

	Arguments(int argc, const char* argv[])
	{
		// Copy from the command-line into local storage
		args.resize(argc);
		for (size_t i = 0; i < args.size(); i++)
		{
			args[i] = argv[i];
		}
	}

	size_t Count() const
	{
		return args.size();
	}

	size_t GetIndexOf(const std::string& arg, int occurrence = 0) const
	{
		// Linear search for a matching argument
		int found = 0;
		for (size_t i = 0; i < args.size(); i++)
		{
			if (args[i] == arg)
			{
				if (found++ == occurrence)
				{
					return i;
				}
			}
		}

		return NOT_FOUND;
	}

	bool Have(const std::string& arg) const
	{
		return GetIndexOf(arg) != NOT_FOUND;
	}

	std::string GetProperty(const std::string& arg, int occurrence = 0) const
	{
		// Does the arg exist and does it have a value
		size_t index = GetIndexOf(arg, occurrence);
		if (index == NOT_FOUND || index + 1 >= args.size())
		{
			return "";
		}

		return args[index + 1];
	}

	// Every value given to a repeatable flag
	std::vector<std::string> GetProperties(const std::string& arg) const
	{
		std::vector<std::string> values;
		for (int i = 0; GetIndexOf(arg, i) != NOT_FOUND; i++)
		{
			std::string value = GetProperty(arg, i);
			if (value != "")
				values.push_back(value);
		}
		return values;
	}

	// 0/1 valued flag, returning the default when not specified
	bool GetBoolProperty(const std::string& arg, bool default_value) const
	{
		std::string value = GetProperty(arg);
		if (value == "")
			return default_value;
		return atoi(value.c_str()) != 0;
	}

	// Arguments that are neither flags nor flag values, skipping the executable name
	std::vector<std::string> GetPositionals(const std::vector<std::string>& switches) const
	{
		std::vector<std::string> positionals;
		for (size_t i = 1; i < args.size(); i++)
		{
			const std::string& arg = args[i];
			if (arg.size() > 1 && arg[0] == '-')
			{
				bool is_switch = false;
				for (size_t j = 0; j < switches.size(); j++)
				{
					if (switches[j] == arg)
						is_switch = true;
				}

				// Skip the value
				if (!is_switch)
					i++;
				continue;
			}

			positionals.push_back(arg);
		}
		return positionals;
	}

	const std::string& operator [] (int index) const
	{
		return args[index];
	}

	std::vector<std::string> args;
};
