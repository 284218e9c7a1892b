#pragma once
#include <istream>
#include <string>
#include <vector>

#include "../probes/probe_target.hpp"

namespace beagle {
// Replaces the first '$' in tmpl with user.
std::string substitute_user(const std::string& tmpl, const std::string& user);

// Reads "name,report_url_template,check_url_template" records. Fails on any
// record without exactly three fields or on malformed quoting; out is left
// untouched on failure.
bool parse_targets_csv(std::istream& in, const std::string& user, std::vector<ProbeTarget>& out,
                       std::string& err);

// As parse_targets_csv, plus: the file must open and yield at least one target.
bool load_targets(const std::string& path, const std::string& user,
                  std::vector<ProbeTarget>& out, std::string& err);
}  // namespace beagle
