#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Command line options of the form --name value; booleans are bare flags and
// vector options consume every following token that does not start with "--"
class ParamList {
public:
    using Target = std::variant<bool*, int32_t*, uint32_t*, float*, double*, std::string*,
        std::vector<int32_t>*, std::vector<double>*, std::vector<std::string>*>;

    template<typename T>
    ParamList& add_option(const std::string& name, const std::string& description, T& value, bool required = false) {
        options_.push_back({name, description, Target(&value), required, false, describe(value)});
        return *this;
    }

    // Throws std::invalid_argument on unknown options, malformed values or missing required options
    void readArgs(int32_t argc, char** argv);
    void print_options() const;
    void print_help() const;
    // True if the option appeared on the command line
    bool is_set(const std::string& name) const;

private:
    struct Option {
        std::string name;
        std::string description;
        Target target;
        bool required;
        bool set;
        std::string defaultValue;
    };
    std::vector<Option> options_;

    Option* find(const std::string& name);
    static std::string valueString(const Target& target);

    template<typename T>
    static std::string describe(const T& value) {
        return valueString(Target(const_cast<T*>(&value)));
    }
};
