#pragma once
#include <string>

// Reads the config and {"meta", "requests"} files, plans every request and
// writes {"meta", "results"} to output_path. Returns the process exit status:
// 1 when a file cannot be opened or parsed, 0 otherwise (failed requests are
// reported inside the results).
int run_batch(const std::string &config_path, const std::string &requests_path,
              const std::string &output_path);
