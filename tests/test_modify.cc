/*
 * test_modify.cc -- entries and modification lists
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include "test.hh"
#include <catch2/catch.hpp>

using idm::Entry;
using idm::Modify;
using idm::ModifyList;

SCENARIO( "Entry attribute access", "[entry]" ) {
  GIVEN("An entry with a multi-valued attribute") {
    Entry e{idm::Attrs{ { "name", { "alice" } },
                        { "mail", { "alice@example.com", "a@example.com" } } }};

    THEN("values are found by equality and substring") {
      REQUIRE(e.present("mail"));
      REQUIRE(!e.present("uuid"));
      REQUIRE(e.equals("mail", "a@example.com"));
      REQUIRE(!e.equals("mail", "example.com"));
      REQUIRE(e.contains("mail", "example.com"));
      REQUIRE(e.first("mail") == std::string("alice@example.com"));
      REQUIRE(e.get("uuid") == nullptr);
      REQUIRE(!e.uuid().has_value());
    }

    THEN("with() replaces an attribute in a copy") {
      Entry f = e.with("uuid", { test_uuid(1) });
      REQUIRE(f.uuid() == test_uuid(1));
      REQUIRE(!e.present("uuid"));
    }
  }
}

SCENARIO( "Applying modifications", "[modify]" ) {
  GIVEN("An entry without mail") {
    Entry e{idm::Attrs{ { "class", { "person" } }, { "name", { "carol" } } }};

    WHEN("mail is added and then purged") {
      ModifyList ml{{ Modify::present("mail", "x@y"), Modify::purged("mail") }};
      Entry result = ml.apply(e);

      THEN("the entry has no mail attribute") {
        REQUIRE(!result.present("mail"));
        REQUIRE(result == e);
      }
    }

    WHEN("a value is added twice") {
      ModifyList ml{{ Modify::present("mail", "x@y"), Modify::present("mail", "x@y") }};
      Entry result = ml.apply(e);

      THEN("both occurrences are kept") {
        REQUIRE(result.get("mail")->size() == 2);
      }

      AND_WHEN("the value is removed") {
        Entry removed = ModifyList{{ Modify::removed("mail", "x@y") }}.apply(result);

        THEN("every occurrence is gone and so is the attribute") {
          REQUIRE(!removed.present("mail"));
          REQUIRE(removed.get("mail") == nullptr);
        }
      }
    }

    WHEN("a value that is not present is removed") {
      Entry result = ModifyList{{ Modify::removed("name", "dave") }}.apply(e);

      THEN("the entry is unchanged") {
        REQUIRE(result == e);
      }
    }
  }

  GIVEN("A modification list") {
    ModifyList ml{{ Modify::present("mail", "x@y"), Modify::purged("description") }};

    THEN("the touched attributes are known") {
      REQUIRE(ml.touches("mail"));
      REQUIRE(ml.touches("description"));
      REQUIRE(!ml.touches("uuid"));
      REQUIRE(!ml.empty());
      REQUIRE(ModifyList{}.empty());
    }
  }
}
