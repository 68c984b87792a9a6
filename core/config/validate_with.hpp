/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>

#define CLI_VALIDATE(TYPE) \
  inline void validate(    \
      boost::any &out, const std::vector<std::string> &values, TYPE *, int)

namespace datex::config {
  /**
   * Parses single option value with f, exceptions of f are reported as
   * invalid option value
   */
  template <typename F>
  void validateWith(boost::any &out,
                    const std::vector<std::string> &values,
                    const F &f) {
    namespace po = boost::program_options;
    po::check_first_occurrence(out);
    const auto &value{po::get_single_string(values)};
    try {
      out = f(value);
    } catch (const std::exception &) {
      boost::throw_exception(po::invalid_option_value{value});
    }
  }
}  // namespace datex::config
