#pragma once
#include <atomic>
#include <iostream>
#include "query_log.hpp"

// Interactive operator console. Returns on QUIT, end of input or when
// terminate_flag is raised; always leaves terminate_flag set.
void run_cli(QueryLog &ql, std::atomic<bool> &terminate_flag,
             std::istream &in = std::cin, std::ostream &out = std::cout);
