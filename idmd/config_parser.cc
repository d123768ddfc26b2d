/*
 * config_parser.cc -- YAML configuration of the IDM daemon
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>

#include "idm/idm.hh"
#include "config_parser.hh"

namespace idm_config {

std::string
getDefaultConfigFile(void) {
  char *home = getenv("HOME");
  std::filesystem::path root{"/"};
  std::error_code err;

  if (home) { /* check if $HOME/.idmdrc or $HOME/.local/idm/idmdrc exists */
    static const char *local_searchpaths[] = { ".idmdrc", ".local/idm/idmdrc" };

    for (size_t idx=0; idx < sizeof(local_searchpaths)/sizeof(local_searchpaths[0]); idx++) {
      std::filesystem::path path{std::filesystem::path(home)/local_searchpaths[idx]};
      if (std::filesystem::exists(path, err)) {
        return path;
      }
    }
  }
  if (std::filesystem::exists(root/"etc"/"idmdrc", err)) {
    return root/"etc"/"idmdrc";
  }
  return "";
}

parser::parser(void)
  : session_timeout(IDM_AUTH_SESSION_TIMEOUT),
    max_filter_depth(IDM_FILTER_MAX_DEPTH) {
}

/* explicitly define destructor to avoid inlining warning */
parser::~parser(void) {
}

/* Missing keys of a const node yield invalid nodes that must not be
 * asked for their type. */
static inline bool
isScalar(const YAML::Node &node) {
  return node && node.IsScalar();
}

/* Returns the scalar or the list of scalars in @p node as values. */
static idm::Values
readValues(const YAML::Node &node) {
  idm::Values values;

  if (!node) {
    return values;
  } else if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto &v : node) {
      if (v.IsScalar()) {
        values.push_back(v.as<std::string>());
      }
    }
  }
  return values;
}

static std::set<std::string>
readNames(const YAML::Node &node) {
  idm::Values values = readValues(node);
  return std::set<std::string>(values.begin(), values.end());
}

void
parser::readEndpoints(void) {
  if (auto ep = (*config_root)["endpoints"]) {
    std::vector<YAML::Node> interfaces;

    if (ep.IsMap()) { /* single entry */
      interfaces.push_back(ep);
    } else if (ep.IsSequence()) { /* list */
      for (const auto &entry : ep) {
        if (entry.IsMap()) {
          interfaces.push_back(entry);
        }
      }
    }

    for (const auto &iface : interfaces) {
      auto addr = iface["interface"];
      if (!isScalar(addr)) {
        continue;
      }

      Endpoint endpoint;
      endpoint.interface = addr.as<std::string>();
      endpoint.port = iface["udp"] ? iface["udp"].as<uint16_t>() : IDM_DEFAULT_COAP_PORT;
      endpoints.push_back(endpoint);
    }
  }
}

void
parser::readAuth(void) {
  auto auth = (*config_root)["auth"];
  if (auth.IsMap()) {
    if (auth["session_timeout"]) {
      session_timeout = auth["session_timeout"].as<unsigned int>();
    }
  }
}

bool
parser::readFilter(void) {
  auto filter = (*config_root)["filter"];
  if (filter.IsMap()) {
    if (filter["max_depth"]) {
      size_t depth = filter["max_depth"].as<size_t>();
      if (depth == 0) {
        idm_log(IDM_LOG_ERR, "filter.max_depth must be at least 1\n");
        return false;
      }
      if (depth > IDM_FILTER_DEPTH_LIMIT) {
        idm_log(IDM_LOG_WARNING, "filter.max_depth %zu exceeds limit, using %d\n",
                depth, IDM_FILTER_DEPTH_LIMIT);
        depth = IDM_FILTER_DEPTH_LIMIT;
      }
      max_filter_depth = depth;
    }
  }
  return true;
}

void
parser::readSchema(void) {
  if (auto schema = (*config_root)["schema"]) {

    if (schema.IsSequence()) {
      for (const auto &cls : schema) {
        if (!cls.IsMap() || !isScalar(cls["name"])) {
          continue;
        }
        classes.push_back(idm::SchemaClass{ cls["name"].as<std::string>(),
                                            readNames(cls["must"]),
                                            readNames(cls["may"]) });
      }
    }
  }
}

void
parser::readAccounts(void) {
  if (auto accts = (*config_root)["accounts"]) {

    if (accts.IsSequence()) {
      for (const auto &acct : accts) {
        if (!acct.IsMap() || !isScalar(acct["name"])) {
          continue;
        }

        idm::Account account;
        account.name = acct["name"].as<std::string>();
        for (const auto &m : readValues(acct["mechanisms"])) {
          if (auto mech = idm::auth_allowed_from_name(m)) {
            account.mechanisms.insert(*mech);
          } else {
            idm_log(IDM_LOG_WARNING, "account %s: unknown mechanism %s\n",
                    account.name.c_str(), m.c_str());
          }
        }
        if (acct["password"]) {
          account.password = acct["password"].as<std::string>();
        }
        if (acct["locked"]) {
          account.locked = acct["locked"].as<bool>();
        }
        accounts.push_back(account);
      }
    }
  }
}

void
parser::readEntries(void) {
  if (auto list = (*config_root)["entries"]) {

    if (list.IsSequence()) {
      for (const auto &e : list) {
        if (!e.IsMap()) {
          continue;
        }

        idm::Attrs attrs;
        for (const auto &attr : e) {
          attrs[attr.first.as<std::string>()] = readValues(attr.second);
        }
        entries.emplace_back(std::move(attrs));
      }
    }
  }
}

bool
parser::load(const YAML::Node &node) {
  if (!node.IsMap() && !node.IsNull()) {
    idm_log(IDM_LOG_ERR, "configuration is not a map\n");
    return false;
  }
  config_root = std::make_unique<YAML::Node>(node);
  readEndpoints();
  readAuth();
  if (!readFilter()) {
    return false;
  }
  readSchema();
  readAccounts();
  readEntries();
  return true;
}

bool
parser::parse(std::istream& input) {
  try {
    return load(YAML::Load(input));
  }
  catch (const YAML::ParserException& ex) {
    idm_log(IDM_LOG_ERR, "%s\n", ex.what());
  }
  catch (const YAML::BadConversion& ex) {
    idm_log(IDM_LOG_ERR, "%s\n", ex.what());
  }
  return false;
}

bool
parser::parseFile(const std::string &filename) {
  try {
    return load(YAML::LoadFile(filename));
  }
  catch (const YAML::BadFile& ex) {
    idm_log(IDM_LOG_ERR, "%s: %s\n", filename.c_str(), ex.what());
  }
  catch (const YAML::ParserException& ex) {
    idm_log(IDM_LOG_ERR, "%s: %s\n", filename.c_str(), ex.what());
  }
  catch (const YAML::BadConversion& ex) {
    idm_log(IDM_LOG_ERR, "%s: %s\n", filename.c_str(), ex.what());
  }
  return false;
}

} /* namespace idm_config */
