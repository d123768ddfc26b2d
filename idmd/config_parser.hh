/*
 * config_parser.hh -- YAML configuration of the IDM daemon
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_CONFIG_PARSER_HH
#define _IDM_CONFIG_PARSER_HH 1

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "idm/accounts.hh"
#include "idm/entry.hh"
#include "idm/schema.hh"

namespace idm_config {

/**
 * Returns the first existing file of $HOME/.idmdrc,
 * $HOME/.local/idm/idmdrc and /etc/idmdrc, or the empty string.
 */
std::string getDefaultConfigFile(void);

struct Endpoint {
  std::string interface;
  uint16_t port = 0;
};

class parser {
public:
  using Endpoints = std::vector<Endpoint>;
  using Classes = std::vector<idm::SchemaClass>;
  using Accounts = std::vector<idm::Account>;
  using Entries = std::vector<idm::Entry>;

  parser(void);
  ~parser(void);

  bool parse(std::istream& input);
  bool parseFile(const std::string &filename);

  bool have_config(void) const { return (bool)config_root; }

  Endpoints endpoints;
  unsigned int session_timeout;
  size_t max_filter_depth;
  Classes classes;
  Accounts accounts;
  Entries entries;
protected:
  std::unique_ptr<YAML::Node> config_root;

  bool load(const YAML::Node &node);
  void readEndpoints(void);
  void readAuth(void);
  bool readFilter(void);
  void readSchema(void);
  void readAccounts(void);
  void readEntries(void);
};

} /* namespace idm_config */

#endif /* _IDM_CONFIG_PARSER_HH */
