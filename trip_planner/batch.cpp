#include "batch.hpp"
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include "nlohmann/json.hpp"
#include "config.hpp"
#include "requests.hpp"

using json = nlohmann::json;

static bool read_json_file(const std::string &path, json &out) {
    std::ifstream fin(path);
    if (!fin.is_open()) {
        std::cerr << "Failed to open " << path << std::endl;
        return false;
    }
    try {
        fin >> out;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing JSON in " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

int run_batch(const std::string &config_path, const std::string &requests_path,
              const std::string &output_path) {
    PlannerConfig cfg;
    try {
        cfg = load_config(config_path);
    } catch (const ConfigError &e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Config: speed " << cfg.average_speed_kmh << " km/h, weights "
              << cfg.weights.rating_weight << "/" << cfg.weights.distance_weight
              << ", validation " << to_string(cfg.validation) << "\n";

    json requests_json;
    if (!read_json_file(requests_path, requests_json)) return 1;

    if (!requests_json.contains("requests") || !requests_json["requests"].is_array()) {
        std::cerr << "No requests found in " << requests_path << std::endl;
        return 1;
    }

    std::cout << "Loaded " << requests_json["requests"].size() << " requests\n";

    json meta = requests_json.value("meta", json::object());
    std::vector<json> results;
    std::size_t failed = 0;

    auto batch_start = std::chrono::high_resolution_clock::now();

    for (const auto &request : requests_json["requests"]) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json result = process_request(request, cfg);

        auto end_time = std::chrono::high_resolution_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        if (result.contains("error")) {
            ++failed;
            std::cerr << "Request " << result["id"].dump() << " failed: "
                      << result["error"].get<std::string>() << std::endl;
        }
        results.push_back(result);
    }

    auto batch_end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(batch_end - batch_start);
    std::cout << "Planned " << results.size() - failed << "/" << results.size()
              << " requests in " << duration.count() << " ms\n";

    std::ofstream output_file(output_path);
    if (!output_file.is_open()) {
        std::cerr << "Failed to open " << output_path << " for writing" << std::endl;
        return 1;
    }

    json output;
    output["meta"] = meta;
    output["results"] = results;
    output_file << output.dump(4) << std::endl;
    output_file.close();

    std::cout << "Output written to " << output_path << "\n";
    return 0;
}
