#include "params.h"
#include "utils.h"
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace {

template<typename T>
T parseScalar(const std::string& name, const std::string& token) {
    std::istringstream iss(token);
    T value;
    if (!(iss >> value) || !iss.eof()) {
        throw std::invalid_argument("Invalid value '" + token + "' for --" + name);
    }
    return value;
}

template<typename T>
std::string joinValues(const std::vector<T>& values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << " ";
        oss << values[i];
    }
    return oss.str();
}

bool isOptionToken(const std::string& token) {
    return token.size() > 2 && token[0] == '-' && token[1] == '-';
}

} // namespace

ParamList::Option* ParamList::find(const std::string& name) {
    for (auto& opt : options_) {
        if (opt.name == name) return &opt;
    }
    return nullptr;
}

bool ParamList::is_set(const std::string& name) const {
    for (const auto& opt : options_) {
        if (opt.name == name) return opt.set;
    }
    return false;
}

std::string ParamList::valueString(const Target& target) {
    return std::visit([](auto* ptr) -> std::string {
        using T = std::remove_pointer_t<decltype(ptr)>;
        if constexpr (std::is_same_v<T, bool>) {
            return *ptr ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return *ptr;
        } else if constexpr (std::is_same_v<T, std::vector<int32_t>> ||
                             std::is_same_v<T, std::vector<double>> ||
                             std::is_same_v<T, std::vector<std::string>>) {
            return joinValues(*ptr);
        } else {
            std::ostringstream oss;
            oss << *ptr;
            return oss.str();
        }
    }, target);
}

void ParamList::readArgs(int32_t argc, char** argv) {
    int32_t i = 1;
    while (i < argc) {
        std::string token = argv[i];
        if (!isOptionToken(token)) {
            throw std::invalid_argument("Unexpected argument: " + token);
        }
        std::string name = token.substr(2);
        Option* opt = find(name);
        if (opt == nullptr) {
            throw std::invalid_argument("Unknown option: " + token);
        }
        ++i;
        std::vector<std::string> values;
        while (i < argc && !isOptionToken(argv[i])) {
            values.emplace_back(argv[i]);
            ++i;
        }
        std::visit([&](auto* ptr) {
            using T = std::remove_pointer_t<decltype(ptr)>;
            if constexpr (std::is_same_v<T, bool>) {
                if (values.empty()) {
                    *ptr = true;
                } else if (values.size() == 1) {
                    std::string v = toLower(values[0]);
                    if (v == "1" || v == "true" || v == "yes") *ptr = true;
                    else if (v == "0" || v == "false" || v == "no") *ptr = false;
                    else throw std::invalid_argument("Invalid value '" + values[0] + "' for --" + name);
                } else {
                    throw std::invalid_argument("Too many values for --" + name);
                }
            } else if constexpr (std::is_same_v<T, std::vector<int32_t>> ||
                                 std::is_same_v<T, std::vector<double>> ||
                                 std::is_same_v<T, std::vector<std::string>>) {
                using V = typename T::value_type;
                if (values.empty()) {
                    throw std::invalid_argument("Missing value for --" + name);
                }
                ptr->clear();
                for (const auto& v : values) {
                    if constexpr (std::is_same_v<V, std::string>) {
                        ptr->push_back(v);
                    } else {
                        ptr->push_back(parseScalar<V>(name, v));
                    }
                }
            } else {
                if (values.size() != 1) {
                    throw std::invalid_argument("Expected exactly one value for --" + name);
                }
                if constexpr (std::is_same_v<T, std::string>) {
                    *ptr = values[0];
                } else {
                    *ptr = parseScalar<T>(name, values[0]);
                }
            }
        }, opt->target);
        opt->set = true;
    }
    for (const auto& opt : options_) {
        if (opt.required && !opt.set) {
            throw std::invalid_argument("Missing required option --" + opt.name);
        }
    }
}

void ParamList::print_options() const {
    for (const auto& opt : options_) {
        if (!opt.set) continue;
        notice("--%s %s", opt.name.c_str(), valueString(opt.target).c_str());
    }
}

void ParamList::print_help() const {
    std::cerr << "Options:\n";
    for (const auto& opt : options_) {
        std::cerr << "  --" << opt.name;
        if (opt.required) std::cerr << " (required)";
        std::cerr << "\n      " << opt.description;
        if (!opt.required && !opt.defaultValue.empty()) {
            std::cerr << " [" << opt.defaultValue << "]";
        }
        std::cerr << "\n";
    }
}
