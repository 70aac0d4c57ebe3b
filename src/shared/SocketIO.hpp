#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "../helpers/Timer.hpp"

/*
    Deadline-bound io on non-blocking sockets. Every call returns an empty string on success
    and a description of the failure otherwise ("timed out" once the deadline passes).
*/

std::string waitForFd(int fd, short events, const CTimer& deadline);
std::string writeAll(int fd, const std::string& data, const CTimer& deadline);
std::string readExact(int fd, uint8_t* buf, size_t len, const CTimer& deadline);
