#pragma once

#include <cctype>
#include <getopt.h>
#include <unistd.h>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace SvgServe
{

// to support custom type, you can specialize this template in namespace SvgServe like below
// or support the following constructor T(const std::string&)
template <typename T>
inline T from_string(const std::string& v) {
    return T(v);
}

class arg_parser {
public:
    enum param_type : std::int32_t
    {
        with_none_param,
        required_param,
        optional_param
    };
    struct parser_entry {
        std::string name;
        std::int32_t option_value;
        param_type type;
        std::string opt_usage;
        std::string param_description;
        std::optional<std::vector<std::string>> parser_values;
    };
    static constexpr std::int8_t kReservedShortOption[] = { '?' /*for invalid option*/, ':' /*missing param*/ };
    static constexpr std::int32_t kNoShortOption        = -1;
    static constexpr std::int32_t kHealperShortOption   = 'h';
    static constexpr std::int32_t kVersionShortOption   = 'v';
    static constexpr const char* kHelperOptionName      = "help";
    static constexpr const char* kVersionOptionName     = "version";

public:
    arg_parser(int argc, char* argv[], const std::string& version = "1.0.0");
    bool AddOption(const std::string& name,
                   const std::string& opt_usage,
                   std::int32_t short_option_value      = kNoShortOption,
                   param_type type                      = with_none_param,
                   const std::string& param_description = "param");
    // return false when the command line is invalid, the reason is printed to stderr
    bool ParseCommandLine();
    // free text printed by ShowHelp between the usage line and the option list
    void SetUsageGuide(const std::string& guide);
    void ShowHelp(std::ostream& os = std::cout) const;
    void ShowVersion(std::ostream& os = std::cout) const;
    std::optional<std::vector<std::string>> GetOptionValues(const std::string& name) const;
    std::optional<std::string> GetOptionValue(const std::string& name) const;
    const std::vector<std::string>& GetNonOptionValues() const;
    bool HasParam(const std::string& name = kHelperOptionName) const;

    template <typename T>
    T GetValue(const std::string& name, const T& default_value = {}) const {
        auto v = GetOptionValue(name);
        if (!v.has_value()) return default_value;
        try {
            return from_string<T>(v.value());
        } catch (const std::exception& e) {
            std::cerr << "convert option:" << name << " value:" << v.value() << " failed:" << e.what() << std::endl;
            return default_value;
        }
    }

private:
    const int argc;
    char** const argv;
    const std::string version;
    std::int32_t current_option_value = 128;
    std::string_view program_path;
    std::string usage_guide;
    std::vector<std::string> no_option_params;
    std::unordered_map<std::string, parser_entry> options;
    std::map<std::int32_t, std::string> short_options_dict;
};

inline arg_parser::arg_parser(int argc, char* argv[], const std::string& version) :
argc(argc), argv(argv), version(version), program_path(argc > 0 ? argv[0] : "") {
    for (auto reserved : kReservedShortOption) {
        short_options_dict.emplace(reserved, "__reserved__");
    }
    AddOption(kHelperOptionName, "show this help page", kHealperShortOption, with_none_param);
    AddOption(kVersionOptionName, "show version information", kVersionShortOption, with_none_param);
}

inline bool arg_parser::AddOption(const std::string& name,
                                  const std::string& opt_usage,
                                  std::int32_t option_value,
                                  param_type type,
                                  const std::string& param_description) {
    auto iter = options.find(name);
    if (iter != options.end()) {
        std::cerr << "option " << name << " already exists." << std::endl;
        return false;
    }
    if (option_value != kNoShortOption && !std::isprint(option_value)) {
        std::cerr << "Invalid short option value " << option_value << std::endl;
        return false;
    }
    auto iter_short = short_options_dict.find(option_value);
    if (iter_short != short_options_dict.end()) {
        std::cerr << "short option value:" << (char)option_value << " already exists for option:" << iter_short->second
                  << std::endl;
        return false;
    }
    if (option_value == kNoShortOption) {
        option_value = current_option_value++;
    }
    short_options_dict.emplace(option_value, name);
    options.emplace(name, parser_entry { name, option_value, type, opt_usage, param_description, std::nullopt });
    return true;
}

inline bool arg_parser::ParseCommandLine() {
    std::vector<option> long_options;
    // leading ':' makes getopt report a missing argument as ':' instead of '?'
    std::string short_options = ":";
    for (const auto& [name, option] : options) {
        auto& new_long_option = long_options.emplace_back();
        new_long_option.name  = option.name.c_str();
        std::string new_short_option;
        if (option.option_value < 128 && std::isprint(option.option_value)) {
            new_short_option.push_back(static_cast<char>(option.option_value));
        }
        if (option.type == with_none_param) {
            new_long_option.has_arg = no_argument;
        } else if (option.type == required_param) {
            new_long_option.has_arg = required_argument;
            if (!new_short_option.empty()) new_short_option += ":";
        } else {
            new_long_option.has_arg = optional_argument;
            if (!new_short_option.empty()) new_short_option += "::";
        }
        new_long_option.flag = nullptr;
        new_long_option.val  = option.option_value;
        short_options += new_short_option;
    }
    long_options.push_back({ nullptr, 0, nullptr, 0 });
    // getopt keeps global state, 0 forces a full reinitialization
    optind = 0;
    opterr = 0;
    while (true) {
        int option_index = 0;
        int res          = getopt_long(argc, argv, short_options.data(), long_options.data(), &option_index);

        if (res == -1) {
            break;
        }

        switch (res) {
        case 0: {
            std::cerr << "internal error for flag long opt" << std::endl;
            return false;
        }
        case '?': {
            if (optopt > 0 && optopt < 128)
                std::cerr << "invalid option: -" << static_cast<char>(optopt) << std::endl;
            else
                std::cerr << "invalid option: " << argv[optind - 1] << std::endl;
            return false;
        }
        case ':': {
            std::cerr << "option " << argv[optind - 1] << " requires an argument" << std::endl;
            return false;
        }
        default: {
            auto iter = short_options_dict.find(res);
            if (iter == short_options_dict.end()) {
                std::cerr << "internal error can't find:" << res << std::endl;
                return false;
            }
            auto option_iter = options.find(iter->second);
            if (option_iter == options.end()) {
                std::cerr << "internal error can't find option:" << iter->second << std::endl;
                return false;
            }

            auto& current_option = option_iter->second;
            if (!current_option.parser_values.has_value()) {
                current_option.parser_values = std::vector<std::string>();
            }
            switch (current_option.type) {
            case optional_param: {
                if (optarg) current_option.parser_values.value().push_back(optarg);
            } break;
            case required_param: {
                if (!optarg) {
                    std::cerr << "paser " << iter->second << " internal error" << std::endl;
                    return false;
                }
                current_option.parser_values.value().push_back(optarg);
            } break;
            default: break;
            }
        }
        }
    }
    while (optind < argc) {
        no_option_params.push_back(argv[optind]);
        ++optind;
    }
    return true;
}

inline void arg_parser::SetUsageGuide(const std::string& guide) {
    usage_guide = guide;
}

inline void arg_parser::ShowHelp(std::ostream& os) const {
    os << "Usage for program:" << program_path << " version:" << version << std::endl;
    if (!usage_guide.empty()) os << usage_guide << std::endl;
    os << "Notice:For options with optional arguments,the argument must either immediately follow the short "
          "option or be connected with =."
       << std::endl;
    std::map<std::string, const parser_entry*> sorted_options;
    for (const auto& [name, option] : options) {
        sorted_options.emplace(name, &option);
    }
    for (const auto& [name, option] : sorted_options) {
        if (option->option_value < 128) {
            os << "\t-" << (char)(option->option_value) << ",";
        } else {
            os << "\t";
        }
        os << "--" << name;
        if (option->type == required_param) {
            os << " <" << option->param_description << ">";
        } else if (option->type == optional_param) {
            os << " [" << option->param_description << "]";
        }
        os << "\t" << option->opt_usage << std::endl;
    }
}

inline void arg_parser::ShowVersion(std::ostream& os) const {
    os << "Version: " << version << std::endl;
}

inline std::optional<std::vector<std::string>> arg_parser::GetOptionValues(const std::string& name) const {
    auto iter = options.find(name);
    return iter == options.end() ? std::nullopt : iter->second.parser_values;
}

inline std::optional<std::string> arg_parser::GetOptionValue(const std::string& name) const {
    auto iter = options.find(name);
    if (iter == options.end() || !iter->second.parser_values.has_value()) return std::nullopt;
    auto& value = iter->second.parser_values.value();
    // the last occurrence wins
    return value.empty() ? "" : value.back();
}

inline const std::vector<std::string>& arg_parser::GetNonOptionValues() const {
    return no_option_params;
}

inline bool arg_parser::HasParam(const std::string& name) const {
    return GetOptionValue(name).has_value();
}

template <>
inline std::string from_string(const std::string& v) {
    return v;
}

} // namespace SvgServe
