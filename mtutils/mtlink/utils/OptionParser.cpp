//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/OptionParser.h"

#include <cstring>
#include <utility>

namespace mtlink {

void OptionParser::set_description(string description) {
  description_ = std::move(description);
}

void OptionParser::add_checked_option(char short_key, Slice long_key, Slice description,
                                      std::function<Status(Slice)> callback) {
  options_.push_back(Option{Option::Type::Arg, short_key, long_key.str(), description.str(), std::move(callback)});
}

void OptionParser::add_checked_option(char short_key, Slice long_key, Slice description,
                                      std::function<Status(void)> callback) {
  options_.push_back(Option{Option::Type::NoArg, short_key, long_key.str(), description.str(),
                            [callback = std::move(callback)](Slice) { return callback(); }});
}

void OptionParser::add_option(char short_key, Slice long_key, Slice description,
                              std::function<void(Slice)> callback) {
  add_checked_option(short_key, long_key, description, [callback = std::move(callback)](Slice parameter) {
    callback(parameter);
    return Status::OK();
  });
}

void OptionParser::add_option(char short_key, Slice long_key, Slice description, std::function<void(void)> callback) {
  add_checked_option(short_key, long_key, description, [callback = std::move(callback)]() {
    callback();
    return Status::OK();
  });
}

void OptionParser::add_check(std::function<Status()> check) {
  checks_.push_back(std::move(check));
}

const OptionParser::Option *OptionParser::find_short(char key) const {
  for (auto &option : options_) {
    if (option.short_key != '\0' && option.short_key == key) {
      return &option;
    }
  }
  return nullptr;
}

const OptionParser::Option *OptionParser::find_long(Slice key) const {
  for (auto &option : options_) {
    if (!option.long_key.empty() && Slice(option.long_key) == key) {
      return &option;
    }
  }
  return nullptr;
}

Result<vector<char *>> OptionParser::run(int argc, char *argv[], int expected_non_option_count) {
  vector<char *> non_options;
  for (int arg_pos = 1; arg_pos < argc; arg_pos++) {
    const char *arg = argv[arg_pos];
    if (arg[0] != '-' || arg[1] == '\0') {
      non_options.push_back(argv[arg_pos]);
      continue;
    }
    if (arg[1] == '-' && arg[2] == '\0') {
      // everything after "--" is a non-option parameter
      while (++arg_pos < argc) {
        non_options.push_back(argv[arg_pos]);
      }
      break;
    }

    if (arg[1] == '-') {
      Slice long_arg(arg + 2, std::strlen(arg + 2));
      Slice param;
      auto equal_pos = long_arg.find('=');
      bool has_equal = equal_pos != static_cast<size_t>(-1);
      if (has_equal) {
        param = long_arg.substr(equal_pos + 1);
        long_arg = long_arg.substr(0, equal_pos);
      }

      auto option = find_long(long_arg);
      if (option == nullptr) {
        return Status::Error(PSLICE() << "Option \"" << long_arg << "\" is unrecognized");
      }
      if (option->type == Option::Type::NoArg) {
        if (has_equal) {
          return Status::Error(PSLICE() << "Option \"" << long_arg << "\" must not have an argument");
        }
      } else if (!has_equal) {
        if (++arg_pos == argc) {
          return Status::Error(PSLICE() << "Option \"" << long_arg << "\" must have an argument");
        }
        param = Slice(argv[arg_pos], std::strlen(argv[arg_pos]));
      }

      TRY_STATUS_PREFIX(option->arg_callback(param), PSLICE() << "Invalid value of option \"" << long_arg << "\": ");
      continue;
    }

    for (size_t opt_pos = 1; arg[opt_pos] != '\0'; opt_pos++) {
      auto option = find_short(arg[opt_pos]);
      if (option == nullptr) {
        return Status::Error(PSLICE() << "Option \"" << arg[opt_pos] << "\" is unrecognized");
      }

      Slice param;
      if (option->type == Option::Type::Arg) {
        if (arg[opt_pos + 1] == '\0') {
          if (++arg_pos == argc) {
            return Status::Error(PSLICE() << "Option \"" << arg[opt_pos] << "\" must have an argument");
          }
          param = Slice(argv[arg_pos], std::strlen(argv[arg_pos]));
        } else {
          param = Slice(arg + opt_pos + 1, std::strlen(arg + opt_pos + 1));
        }
        TRY_STATUS_PREFIX(option->arg_callback(param),
                          PSLICE() << "Invalid value of option \"" << arg[opt_pos] << "\": ");
        break;
      }
      TRY_STATUS(option->arg_callback(param));
    }
  }

  if (expected_non_option_count >= 0 && non_options.size() != static_cast<size_t>(expected_non_option_count)) {
    if (expected_non_option_count == 0) {
      return Status::Error("Unexpected non-option parameters specified");
    }
    if (non_options.size() > static_cast<size_t>(expected_non_option_count)) {
      return Status::Error("Too many non-option parameters specified");
    }
    return Status::Error("Too few non-option parameters specified");
  }
  for (auto &check : checks_) {
    TRY_STATUS(check());
  }

  return std::move(non_options);
}

StringBuilder &operator<<(StringBuilder &sb, const OptionParser &o) {
  if (!o.description_.empty()) {
    sb << o.description_ << "\n";
  }
  for (auto &opt : o.options_) {
    sb << "  ";
    if (opt.short_key != '\0') {
      sb << '-' << opt.short_key;
      if (!opt.long_key.empty()) {
        sb << ", ";
      }
    }
    if (!opt.long_key.empty()) {
      sb << "--" << opt.long_key;
    }
    if (opt.type == OptionParser::Option::Type::Arg) {
      sb << "=<arg>";
    }
    sb << '\t' << opt.description << '\n';
  }
  return sb;
}

}  // namespace mtlink
