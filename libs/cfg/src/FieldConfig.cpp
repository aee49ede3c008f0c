#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "FieldConfig.h"
#include "Utils.h"

namespace {

std::string LineError(int line_number, const std::string& message) {
  return "Field config line " + std::to_string(line_number) + ": " + message;
}

std::vector<std::string> SplitTokens(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream stream(line);
  std::string token;
  while (stream >> token) tokens.push_back(token);
  return tokens;
}

void ExpectValueCount(const std::vector<std::string>& tokens, size_t count, int line_number) {
  if (tokens.size() - 1 != count) {
    throw std::invalid_argument(LineError(line_number, "'" + tokens[0] + "' expects " +
                                                           std::to_string(count) + " value(s)"));
  }
}

double ParseNumber(const std::string& token, int line_number) {
  std::istringstream stream(token);
  double value;
  stream >> value;
  if (stream.fail() || !stream.eof()) {
    throw std::invalid_argument(LineError(line_number, "not a number: " + token));
  }
  return value;
}

bool ParseBool(const std::string& token, int line_number) {
  if (token == "true" || token == "TRUE") return true;
  if (token == "false" || token == "FALSE") return false;
  throw std::invalid_argument(LineError(line_number, "not a boolean: " + token));
}

}  // namespace

cfg::SizeClass cfg::ParseSizeClass(const std::string& value) {
  if (value == "adult") return SizeClass::ADULT;
  if (value == "kid") return SizeClass::KID;
  throw std::invalid_argument("Unknown field size: '" + value + "' (expected adult or kid)");
}

std::string cfg::SizeClassName(SizeClass size) {
  return size == SizeClass::KID ? "kid" : "adult";
}

cfg::FieldConfig cfg::ParseFieldConfig(const std::string& text) {
  FieldConfig config;
  std::istringstream stream(text);
  std::string line;
  int line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    std::vector<std::string> tokens = SplitTokens(line);
    if (tokens.empty() || tokens[0][0] == '#') continue;

    const std::string& key = tokens[0];
    if (key == "name") {
      ExpectValueCount(tokens, 1, line_number);
      config.name = tokens[1];
    } else if (key == "size") {
      ExpectValueCount(tokens, 1, line_number);
      try {
        config.size = ParseSizeClass(tokens[1]);
      } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(LineError(line_number, e.what()));
      }
    } else if (key == "turf_physics") {
      ExpectValueCount(tokens, 1, line_number);
      config.turf_physics = ParseBool(tokens[1], line_number);
    } else if (key == "translation") {
      ExpectValueCount(tokens, 3, line_number);
      config.translation = Eigen::Vector3d(ParseNumber(tokens[1], line_number),
                                           ParseNumber(tokens[2], line_number),
                                           ParseNumber(tokens[3], line_number));
    } else if (key == "rotation") {
      ExpectValueCount(tokens, 4, line_number);
      Eigen::Vector3d axis(ParseNumber(tokens[1], line_number),
                           ParseNumber(tokens[2], line_number),
                           ParseNumber(tokens[3], line_number));
      if (axis.norm() < 1e-12) {
        throw std::invalid_argument(LineError(line_number, "rotation axis must be non-zero"));
      }
      double angle_rad = util::WrapAngle(ParseNumber(tokens[4], line_number));
      config.rotation = Eigen::AngleAxisd(angle_rad, axis.normalized());
    } else {
      throw std::invalid_argument(LineError(line_number, "unknown key '" + key + "'"));
    }
  }

  return config;
}

cfg::FieldConfig cfg::LoadFieldConfig(const std::string& path) {
  FieldConfig config = ParseFieldConfig(util::ReadFile(path));
  std::cout << "[cfg::LoadFieldConfig] Loaded '" << config.name << "' ("
            << SizeClassName(config.size) << ") from " << path << std::endl;
  return config;
}
