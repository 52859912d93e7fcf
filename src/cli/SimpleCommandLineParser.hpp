/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the geo-enrich front end
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace geoenrich {

/**
 * @brief Simple command-line argument parser
 *
 * Options are registered up front; parse() fills a name -> value map and
 * reports problems on stderr. Values that look like negative numbers
 * (e.g. a western longitude) are accepted as option values.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse command line arguments
     * @return false when help was shown or an error was reported
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !looks_numeric(arg)) {
                std::string short_name = arg.substr(1);

                auto sit = short_to_long_.find(short_name);
                if (sit == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = sit->second;
                if (options_[option_name].has_value) {
                    if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --lat DEG --lon DEG [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --batch FILE [OPTIONS]\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(options_.at(name));
        }
        std::cout << "    -h, --help               Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --lat 29.76 --lon -95.37 --radius 2mi\n";
        std::cout << "    " << program_name_ << " --lat 43.0 --lon -71.5 --datasets nh_geographic_names --no-defaults\n";
        std::cout << "    " << program_name_ << " --batch points.csv --export results.gpkg\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    The aggregated enrichment map is printed to stdout as JSON.\n";
        std::cout << "    Logs and performance metrics go to stderr.\n";
    }

private:
    static bool looks_numeric(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        char c = arg[1];
        return (c >= '0' && c <= '9') || c == '.';
    }

    static bool is_value(const std::string& arg) {
        return !arg.starts_with("-") || looks_numeric(arg);
    }

    void print_help_section(const Option& option) const {
        std::string head = "    ";
        if (!option.short_name.empty()) {
            head += "-" + option.short_name + ", ";
        }
        head += "--" + option.long_name;
        if (option.has_value) {
            head += " VALUE";
        }
        std::cout << head;
        if (head.size() < 30) {
            std::cout << std::string(30 - head.size(), ' ');
        } else {
            std::cout << "  ";
        }
        std::cout << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace geoenrich
