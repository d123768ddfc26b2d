/*
 * test_configuration.cc -- daemon configuration
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <sstream>

#include "test.hh"
#include "config_parser.hh"
#include <catch2/catch.hpp>

SCENARIO( "Read daemon configuration", "[config]" ) {
  idm_config::parser parser;

  GIVEN("The test configuration file") {
    test_log_off();
    bool ok = parser.parseFile("./testconfig/idmd.yaml");
    test_log_on();
    REQUIRE(ok);
    REQUIRE(parser.have_config());

    THEN("endpoints without port use the default port") {
      REQUIRE(parser.endpoints.size() == 2);
      REQUIRE(parser.endpoints[0].interface == "::1");
      REQUIRE(parser.endpoints[0].port == 20000);
      REQUIRE(parser.endpoints[1].interface == "127.0.0.1");
      REQUIRE(parser.endpoints[1].port == IDM_DEFAULT_COAP_PORT);
    }

    THEN("limits are read") {
      REQUIRE(parser.session_timeout == 120);
      REQUIRE(parser.max_filter_depth == 16);
    }

    THEN("classes accept a single name or a list") {
      REQUIRE(parser.classes.size() == 1);
      REQUIRE(parser.classes[0].name == "printer");
      REQUIRE(parser.classes[0].must == std::set<std::string>{ "name" });
      REQUIRE(parser.classes[0].may == std::set<std::string>{ "description", "location" });
    }

    THEN("unknown mechanisms are skipped") {
      REQUIRE(parser.accounts.size() == 3);
      REQUIRE(parser.accounts[0].mechanisms == std::set<idm::AuthAllowed>{ idm::AuthAllowed::Anonymous });
      REQUIRE(parser.accounts[1].password == "secret");
      REQUIRE(!parser.accounts[1].locked);
      REQUIRE(parser.accounts[2].mechanisms == std::set<idm::AuthAllowed>{ idm::AuthAllowed::Password });
      REQUIRE(parser.accounts[2].locked);
    }

    THEN("the seed entries pass the extended schema") {
      idm::Schema schema = idm::core_schema();
      for (const auto &cls : parser.classes) {
        schema.add_class(cls);
      }
      REQUIRE(parser.entries.size() == 2);
      REQUIRE(parser.entries[0].uuid() == std::string("00000000-0000-4000-8000-000000000001"));
      for (const auto &e : parser.entries) {
        REQUIRE(schema.validate(e).ok());
      }
    }
  }

  GIVEN("A configuration without any section") {
    std::istringstream input("{}");

    THEN("the defaults are kept") {
      REQUIRE(parser.parse(input));
      REQUIRE(parser.endpoints.empty());
      REQUIRE(parser.session_timeout == IDM_AUTH_SESSION_TIMEOUT);
      REQUIRE(parser.max_filter_depth == IDM_FILTER_MAX_DEPTH);
    }
  }

  GIVEN("A filter depth out of range") {
    THEN("zero is rejected") {
      std::istringstream input("filter:\n  max_depth: 0\n");
      test_log_off();
      REQUIRE(!parser.parse(input));
      test_log_on();
      REQUIRE(parser.max_filter_depth == IDM_FILTER_MAX_DEPTH);
    }

    THEN("large values are clamped") {
      std::istringstream input("filter:\n  max_depth: 100000\n");
      test_log_off();
      REQUIRE(parser.parse(input));
      test_log_on();
      REQUIRE(parser.max_filter_depth == IDM_FILTER_DEPTH_LIMIT);
    }
  }

  GIVEN("Broken configurations") {
    THEN("they are rejected") {
      std::istringstream syntax("accounts: [ { name: alice");
      std::istringstream scalar("just a string");
      std::istringstream type("filter:\n  max_depth: deep\n");

      test_log_off();
      REQUIRE(!parser.parse(syntax));
      REQUIRE(!parser.parse(scalar));
      REQUIRE(!parser.parse(type));
      REQUIRE(!parser.parseFile("./testconfig/does-not-exist.yaml"));
      test_log_on();
    }
  }
}
