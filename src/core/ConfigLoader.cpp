/* @file ConfigLoader.cpp
 * @brief JSON -> ExperimentConfig with up-front validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// PZT headers
#include "core/ConfigLoader.hpp"
#include "core/SweepPlanner.hpp"
#include "protocols/FixedPoint.hpp"

using json = nlohmann::json;

namespace pzt::core {

  namespace {

    const json& require(const json& obj, const char* key, const std::string& where) {
      auto it = obj.find(key);
      if (it == obj.end())
        throw ConfigError("[ConfigLoader] missing '" + where + key + "'");
      return *it;
    }

    std::string requireString(const json& obj, const char* key) {
      const json& v = require(obj, key, "");
      if (!v.is_string() || v.get<std::string>().empty())
        throw ConfigError(std::string("[ConfigLoader] '") + key + "' must be a non-empty string");
      return v.get<std::string>();
    }

    int requirePositiveInt(const json& obj, const char* key) {
      const json& v = require(obj, key, "");
      if (!v.is_number_integer() || v.get<long long>() <= 0 ||
          v.get<long long>() > std::numeric_limits<int>::max())
        throw ConfigError(std::string("[ConfigLoader] '") + key + "' must be a positive integer");
      return static_cast<int>(v.get<long long>());
    }

    double requireNumber(const json& obj, const char* key, const std::string& where) {
      const json& v = require(obj, key, where);
      if (!v.is_number())
        throw ConfigError("[ConfigLoader] '" + where + key + "' must be a number");
      return v.get<double>();
    }

    ParameterRange parseRange(const json& channel, const char* name, const std::string& chKey) {
      const std::string where = chKey + "." + name;
      const json& r = require(channel, name, chKey + ".");
      if (!r.is_object())
        throw ConfigError("[ConfigLoader] '" + where + "' must be an object");

      ParameterRange out;
      out.min = requireNumber(r, "min", where + ".");
      out.max = requireNumber(r, "max", where + ".");
      out.step = requireNumber(r, "step", where + ".");

      if (out.step < 0.0)
        throw ConfigError("[ConfigLoader] '" + where + ".step' must be >= 0");
      if (out.min > out.max)
        throw ConfigError("[ConfigLoader] '" + where + "' has min > max");
      constexpr double kLimit = protocols::kMaxIntegerPart + 1.0;
      if (std::fabs(out.min) >= kLimit || std::fabs(out.max) >= kLimit)
        throw ConfigError("[ConfigLoader] '" + where + "' outside the +/-32767.9999 wire range");
      return out;
    }

    protocols::WaveformKind waveformOr(const json& obj, protocols::WaveformKind fallback) {
      auto it = obj.find("waveform_type");
      if (it == obj.end())
        return fallback;
      if (!it->is_string())
        return protocols::parseWaveform(""); // logs + Sine
      return protocols::parseWaveform(it->get<std::string>());
    }

  } // namespace

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  ExperimentConfig ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw ConfigError("[ConfigLoader] cannot open " + path_);

    json doc;
    try {
      doc = json::parse(in);
    } catch (const json::parse_error& e) {
      throw ConfigError("[ConfigLoader] " + path_ + ": " + e.what());
    }
    return parse(doc);
  }

  ExperimentConfig ConfigLoader::parse(const json& doc) {
    if (!doc.is_object())
      throw ConfigError("[ConfigLoader] top level must be a JSON object");

    ExperimentConfig cfg;
    cfg.serialPort = requireString(doc, "serial_port");
    cfg.prefix = requireString(doc, "prefix");
    cfg.nfiles = requirePositiveInt(doc, "nfiles");
    cfg.nrefls = requirePositiveInt(doc, "nrefls");

    if (auto it = doc.find("parallel_sweep"); it != doc.end()) {
      if (!it->is_boolean())
        throw ConfigError("[ConfigLoader] 'parallel_sweep' must be a boolean");
      cfg.parallelSweep = it->get<bool>();
    }

    cfg.waveform = waveformOr(doc, protocols::WaveformKind::Sine);

    if (auto it = doc.find("acquisition"); it != doc.end()) {
      if (!it->is_object())
        throw ConfigError("[ConfigLoader] 'acquisition' must be an object");
      if (it->contains("executable"))
        cfg.acquisition.executable = requireString(*it, "executable");
      if (it->contains("work_dir"))
        cfg.acquisition.workDir = requireString(*it, "work_dir");
    }

    for (std::size_t ch = 0; ch < kNumChannels; ++ch) {
      const std::string key = "ch" + std::to_string(ch + 1);
      ChannelRange& range = cfg.channels[ch];
      range.waveform = cfg.waveform;

      auto it = doc.find(key);
      if (it == doc.end())
        continue; // inactive: stays all-zero
      if (!it->is_object())
        throw ConfigError("[ConfigLoader] '" + key + "' must be an object");

      range.amplitude = parseRange(*it, "amplitude", key);
      range.bias = parseRange(*it, "bias", key);
      range.frequency = parseRange(*it, "frequency", key);
      range.waveform = waveformOr(*it, cfg.waveform);
    }

    // an oversized grid is a configuration error
    try {
      SweepPlanner::fromConfig(cfg);
    } catch (const std::invalid_argument& e) {
      throw ConfigError("[ConfigLoader] " + std::string(e.what()));
    }
    return cfg;
  }

} // namespace pzt::core
