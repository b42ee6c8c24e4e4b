#pragma once

#include <stdexcept>
#include <string>

// Bad parameters or inputs detected before (or while) setting up a run.
// Always fatal.
class ConfigError : public std::invalid_argument
{
	public:
		explicit ConfigError(const std::string &what) :
			std::invalid_argument(what)
		{
		}
};

// Foreground cutout has no fully transparent pixel, so there is
// no way to tell the object from its surroundings
class InvalidForegroundError : public std::runtime_error
{
	public:
		explicit InvalidForegroundError(const std::string &what) :
			std::runtime_error(what)
		{
		}
};

class BackgroundTooSmallError : public std::runtime_error
{
	public:
		explicit BackgroundTooSmallError(const std::string &what) :
			std::runtime_error(what)
		{
		}
};

class ForegroundTooLargeError : public std::runtime_error
{
	public:
		explicit ForegroundTooLargeError(const std::string &what) :
			std::runtime_error(what)
		{
		}
};
