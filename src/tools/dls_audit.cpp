// src/tools/dls_audit.cpp
// DLS Audit - offline consistency, repair and size info tool for DLS channels
//
// Modes:
// - consistency-check: validate block files, count structural errors
// - repair:            consistency-check, then rewrite files that had errors
// - size-check:        compare a channel's sizeinfo sidecar with a fresh scan
// - generate:          compute a channel's size info
// - read:              print a sizeinfo sidecar
//
// Usage:
//   dls-audit -c /srv/dls/channel
//   dls-audit -R /srv/dls/channel/0000000052/125
//   dls-audit -g /srv/dls/channel -w /srv/dls/channel/sizeinfo

#include <iostream>
#include <string>
#include <vector>

#include "cli.h"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return dls::run_cli(args, std::cout, std::cerr);
}
