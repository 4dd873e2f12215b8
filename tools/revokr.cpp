/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2026, Regents of the University of California.
 *
 * This file is part of revokr, an offline certificate revocation list tool.
 *
 * revokr is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * revokr is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * revokr, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of revokr authors and contributors.
 */


#include "revokr-commands.hpp"
#include "tool-config.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iostream>

#include <ndn-cxx/util/logging.hpp>

namespace revokr {

NDN_LOG_INIT(revokr.tool);

namespace po = boost::program_options;

static void
usage(std::ostream& os, const std::string& programName, const po::options_description& opts)
{
  os << "Usage: " << programName << " <command> [options]\n"
     << "\n"
     << "Commands:\n"
     << "  create     create a signed or to-be-signed certificate revocation list\n"
     << "  assemble   assemble a signed CRL from a to-be-signed CRL and a detached signature\n"
     << "\n"
     << opts;
}

static po::options_description
makeGlobalOptions(std::string& configFile, std::string& out, std::string& crt, bool& pem, bool& verbose)
{
  po::options_description opts("Global options");
  opts.add_options()
    ("help,h", "print this help message and exit")
    ("version,V", "print version and exit")
    ("verbose,v", po::bool_switch(&verbose), "enable debug logging")
    ("config,C", po::value<std::string>(&configFile), "JSON file with default values")
    ("out,o", po::value<std::string>(&out), "output file, PEM output goes to stdout if omitted")
    ("crt,c", po::value<std::string>(&crt), "issuer certificate (PEM or DER)")
    ("pem", po::bool_switch(&pem), "write output in PEM instead of DER")
    ;
  return opts;
}

static void
applyConfig(const ToolConfig& config, const po::variables_map& vm, std::string& out,
            std::string& crt, bool& pem)
{
  if (vm.count("out") == 0) {
    out = config.out;
  }
  if (vm.count("crt") == 0) {
    crt = config.issuerCertificate;
  }
  if (!pem && config.pem) {
    pem = *config.pem;
  }
}

static int
runCreate(const std::string& programName, int argc, char* argv[])
{
  std::string configFile;
  bool verbose = false;
  bool pem = false;
  bool passwordPrompt = false;
  std::string password;
  CreateOptions options;

  auto opts = makeGlobalOptions(configFile, options.out, options.issuerCertificate, pem, verbose);
  po::options_description createOpts("Options for create");
  createOpts.add_options()
    ("number,n", po::value<std::string>(&options.number), "CRL number (decimal), overrides the number "
                                                            "derived from extended CRLs")
    ("extend,x", po::value<std::vector<std::string>>(&options.extend)->composing(),
                 "existing CRL to extend, may be repeated")
    ("key,k", po::value<std::string>(&options.issuerKey), "issuer private key")
    ("password,p", po::value<std::string>(&password), "private key password")
    ("password-prompt,P", po::bool_switch(&passwordPrompt), "prompt for the private key password")
    ("serials,s", po::value<std::string>(&options.serials), "file with serial numbers to revoke, one per line")
    ("ignore,i", po::value<std::string>(&options.ignore), "file with serial numbers to leave out, one per line")
    ("this-update,T", po::value<std::string>(&options.thisUpdate), "thisUpdate time, defaults to the "
                                                                    "issuer's notBefore")
    ("next-update,N", po::value<std::string>(&options.nextUpdate), "nextUpdate time, defaults to the "
                                                                    "issuer's notAfter")
    ("to-be-signed,t", po::bool_switch(&options.toBeSigned), "output the to-be-signed CRL instead of "
                                                               "signing it")
    ("digest,d", po::value<std::string>(&options.digest), "output file for the digest of the "
                                                          "to-be-signed CRL")
    ;
  opts.add(createOpts);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, opts), vm);
    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  if (vm.count("help") != 0) {
    usage(std::cout, programName, opts);
    return 0;
  }
  if (verbose) {
    ndn::util::Logging::setLevel("revokr.*=DEBUG");
  }

  Diagnostics diag;
  try {
    if (!configFile.empty()) {
      ToolConfig config;
      config.load(configFile);
      applyConfig(config, vm, options.out, options.issuerCertificate, pem);
      if (vm.count("key") == 0 && !options.toBeSigned) {
        options.issuerKey = config.issuerKey;
      }
      if (vm.count("serials") == 0) {
        options.serials = config.serials;
      }
      if (vm.count("ignore") == 0) {
        options.ignore = config.ignore;
      }
      if (vm.count("extend") == 0) {
        options.extend = config.extend;
      }
    }
    if (vm.count("password") != 0) {
      options.password = password;
    }
    options.promptPassword = passwordPrompt;
    options.format = pem ? OutputFormat::PEM : OutputFormat::DER;

    createCrl(options, diag, std::cout);
  }
  catch (const UsageError& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  if (!diag.empty()) {
    NDN_LOG_INFO(diag.getWarnings().size() << " item(s) were skipped, see warnings above");
  }
  return 0;
}

static int
runAssemble(const std::string& programName, int argc, char* argv[])
{
  std::string configFile;
  bool verbose = false;
  bool pem = false;
  AssembleOptions options;

  auto opts = makeGlobalOptions(configFile, options.out, options.issuerCertificate, pem, verbose);
  po::options_description assembleOpts("Options for assemble");
  assembleOpts.add_options()
    ("to-be-signed,t", po::value<std::string>(&options.toBeSigned), "to-be-signed CRL (PEM or DER)")
    ("signature,s", po::value<std::string>(&options.signature), "signature over the to-be-signed CRL "
                                                                "(raw, base64 or PEM)")
    ;
  opts.add(assembleOpts);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, opts), vm);
    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  if (vm.count("help") != 0) {
    usage(std::cout, programName, opts);
    return 0;
  }
  if (verbose) {
    ndn::util::Logging::setLevel("revokr.*=DEBUG");
  }

  try {
    if (!configFile.empty()) {
      ToolConfig config;
      config.load(configFile);
      applyConfig(config, vm, options.out, options.issuerCertificate, pem);
    }
    options.format = pem ? OutputFormat::PEM : OutputFormat::DER;

    assembleCrl(options, std::cout);
  }
  catch (const UsageError& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

static int
main(int argc, char* argv[])
{
  ndn::util::Logging::setLevel("revokr.*=INFO");

  std::string programName = argc > 0 ? argv[0] : "revokr";
  std::string command = argc > 1 ? argv[1] : "";

  if (command == "create") {
    return runCreate(programName, argc - 1, argv + 1);
  }
  if (command == "assemble") {
    return runAssemble(programName, argc - 1, argv + 1);
  }

  std::string configFile;
  std::string out;
  std::string crt;
  bool pem = false;
  bool verbose = false;
  auto opts = makeGlobalOptions(configFile, out, crt, pem, verbose);
  if (command == "-V" || command == "--version") {
    std::cout << "revokr " << REVOKR_VERSION << std::endl;
    return 0;
  }
  if (command == "-h" || command == "--help") {
    usage(std::cout, programName, opts);
    return 0;
  }

  if (command.empty()) {
    std::cerr << "ERROR: missing command" << std::endl;
  }
  else {
    std::cerr << "ERROR: unknown command '" << command << "'" << std::endl;
  }
  usage(std::cerr, programName, opts);
  return 2;
}

} // namespace revokr

int
main(int argc, char* argv[])
{
  return revokr::main(argc, argv);
}
