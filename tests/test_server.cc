/*
 * test_server.cc -- request handling of the query server
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <future>

#include "test.hh"
#include <catch2/catch.hpp>

using idm::AuthAllowed;
using idm::AuthCredential;
using idm::AuthStep;
using idm::Entry;
using idm::Filter;
using idm::Modify;
using idm::ModifyList;
using idm::OperationError;
using idm::SchemaError;

static const std::string alice_uuid = "00000000-0000-4000-8000-000000000001";
static const std::string staff_uuid = "00000000-0000-4000-8000-000000000003";
static const std::string mail_uuid  = "00000000-0000-4000-8000-000000000004";

/* A server on a backend with a person, a group and an application. */
struct TestServer {
  idm::MemoryBackend backend;
  idm::Schema schema;
  idm::AccountStore accounts;
  idm::QueryServer server;

  TestServer(void)
    : schema(idm::core_schema()), server(backend, schema, accounts) {
    accounts.add({ "alice", { AuthAllowed::Anonymous }, "", false });

    idm::Entries seed = {
      Entry{idm::Attrs{ { "class", { "person" } },
                        { "name", { "alice" } },
                        { "displayname", { "Alice" } },
                        { "memberof", { staff_uuid } },
                        { "uuid", { alice_uuid } } }},
      Entry{idm::Attrs{ { "class", { "group" } },
                        { "name", { "staff" } },
                        { "member", { alice_uuid } },
                        { "uuid", { staff_uuid } } }},
      Entry{idm::Attrs{ { "class", { "application" } },
                        { "name", { "mail" } },
                        { "uuid", { mail_uuid } } }}
    };
    REQUIRE(backend.create(seed).ok());
  }

  /* Authenticates alice and returns her token. */
  idm::UserAuthToken login(const std::optional<std::string> &application = std::nullopt) {
    idm::Result<idm::AuthResponse> init =
      server.handle_auth({ AuthStep::make_init("alice", application), std::nullopt });
    REQUIRE(init.ok());
    idm::Result<idm::AuthResponse> resp =
      server.handle_auth({ AuthStep::make_creds({ AuthCredential::anonymous() }),
                           init->sessionid });
    REQUIRE(resp.ok());
    REQUIRE(resp->state.kind == idm::AuthState::Kind::Success);
    REQUIRE(server.session_token(resp->sessionid) == resp->state.token);
    return *resp->state.token;
  }

  size_t count(const Filter &filter) {
    idm::Result<idm::SearchResponse> resp =
      server.handle_search(idm::SearchRequest{ filter }, std::nullopt);
    REQUIRE(resp.ok());
    return resp->entries.size();
  }
};

static const std::optional<idm::UserAuthToken> anonymous_caller;

SCENARIO( "Searching entries", "[server]" ) {
  TestServer t;

  GIVEN("No token") {
    THEN("search by name finds the entry") {
      idm::Result<idm::SearchResponse> resp =
        t.server.handle_search({ Filter::make_eq("name", "alice") }, anonymous_caller);
      REQUIRE(resp.ok());
      REQUIRE(resp->entries.size() == 1);
      REQUIRE(resp->entries.front().uuid() == alice_uuid);
    }

    THEN("the always false filter finds nothing") {
      REQUIRE(t.count(Filter::make_or({})) == 0);
    }

    THEN("the always true filter finds everything") {
      REQUIRE(t.count(Filter::make_and({})) == 3);
    }

    THEN("a filter that refers to the caller cannot be resolved") {
      idm::Result<idm::SearchResponse> resp =
        t.server.handle_search({ Filter::make_self() }, anonymous_caller);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::FilterUUIDResolution);
    }

    THEN("a filter that is nested too deep is rejected") {
      Filter f = Filter::make_pres("name");
      for (size_t n = 0; n < IDM_FILTER_MAX_DEPTH; n++) {
        f = Filter::make_andnot(f);
      }
      test_log_off();
      idm::Result<idm::SearchResponse> resp = t.server.handle_search({ f }, anonymous_caller);
      test_log_on();
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::FilterGeneration);
    }
  }

  GIVEN("The token of alice") {
    idm::UserAuthToken uat = t.login();

    THEN("SelfUUID refers to her entry") {
      idm::Result<idm::SearchResponse> resp =
        t.server.handle_search({ Filter::make_and({ Filter::make_self(),
                                                    Filter::make_pres("name") }) },
                               uat);
      REQUIRE(resp.ok());
      REQUIRE(resp->entries.size() == 1);
      REQUIRE(resp->entries.front().first("name") == std::string("alice"));
    }
  }
}

SCENARIO( "Filter depth bounds of the server", "[server]" ) {
  idm::MemoryBackend backend;
  idm::Schema schema = idm::core_schema();
  idm::AccountStore accounts;

  GIVEN("A depth of zero") {
    idm::QueryServer server(backend, schema, accounts,
                            std::chrono::seconds(IDM_AUTH_SESSION_TIMEOUT), 0);

    THEN("single terms are still accepted") {
      REQUIRE(server.max_filter_depth() == 1);
      REQUIRE(server.handle_search({ Filter::make_pres("name") }, anonymous_caller).ok());
    }
  }

  GIVEN("A depth above the limit") {
    idm::QueryServer server(backend, schema, accounts,
                            std::chrono::seconds(IDM_AUTH_SESSION_TIMEOUT), 100000);

    THEN("it is reduced to the limit") {
      REQUIRE(server.max_filter_depth() == IDM_FILTER_DEPTH_LIMIT);
    }
  }
}

SCENARIO( "Creating entries", "[server]" ) {
  TestServer t;
  Entry bob{idm::Attrs{ { "class", { "person" } },
                        { "name", { "bob" } },
                        { "displayname", { "Bob" } } }};

  GIVEN("No token") {
    THEN("create is not allowed") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_create({ { bob } }, anonymous_caller);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::NotAuthenticated);
      REQUIRE(t.count(Filter::make_eq("name", "bob")) == 0);
    }
  }

  GIVEN("The token of alice") {
    idm::UserAuthToken uat = t.login();

    WHEN("an entry without uuid is created") {
      idm::Result<idm::OperationResponse> resp = t.server.handle_create({ { bob } }, uat);

      THEN("it is stored with a fresh uuid") {
        REQUIRE(resp.ok());
        idm::Result<idm::SearchResponse> found =
          t.server.handle_search({ Filter::make_eq("name", "bob") }, uat);
        REQUIRE(found.ok());
        REQUIRE(found->entries.size() == 1);
        REQUIRE(found->entries.front().uuid().has_value());
        REQUIRE(idm::Uuid::parse(*found->entries.front().uuid()).has_value());
        REQUIRE(t.server.verify().ok());
      }
    }

    WHEN("the request has no entries") {
      idm::Result<idm::OperationResponse> resp = t.server.handle_create({ {} }, uat);

      THEN("it fails with EmptyRequest") {
        REQUIRE(!resp.ok());
        REQUIRE(resp.error().kind() == OperationError::Kind::EmptyRequest);
      }
    }

    WHEN("an entry lacks a required attribute") {
      Entry nameless{idm::Attrs{ { "class", { "person" } }, { "name", { "bob" } } }};
      idm::Result<idm::OperationResponse> resp = t.server.handle_create({ { nameless } }, uat);

      THEN("it fails with a schema violation") {
        REQUIRE(!resp.ok());
        REQUIRE(resp.error() ==
                OperationError::schema_violation(SchemaError::missing_must_attribute("displayname")));
      }
    }

    WHEN("an entry reuses an existing uuid") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_create({ { bob.with("uuid", { alice_uuid }) } }, uat);

      THEN("it fails with a consistency error") {
        REQUIRE(!resp.ok());
        REQUIRE(resp.error() == OperationError::consistency({
              idm::ConsistencyResult{ idm::ConsistencyError::uuid_not_unique(alice_uuid) } }));
      }
    }

    WHEN("an entry has a malformed uuid") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_create({ { bob.with("uuid", { "not-a-uuid" }) } }, uat);

      THEN("it fails with InvalidUuid") {
        REQUIRE(!resp.ok());
        REQUIRE(resp.error().kind() == OperationError::Kind::InvalidUuid);
      }
    }

    WHEN("an entry has an upper case uuid") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_create({ { bob.with("uuid", { "00000000-0000-4000-8000-00000000000A" }) } },
                               uat);

      THEN("it is stored in lower case") {
        REQUIRE(resp.ok());
        REQUIRE(t.count(Filter::make_eq("uuid", "00000000-0000-4000-8000-00000000000a")) == 1);
      }
    }
  }
}

SCENARIO( "Deleting and reviving entries", "[server]" ) {
  TestServer t;
  idm::UserAuthToken uat = t.login();

  GIVEN("The always false filter") {
    THEN("delete is rejected as schema violation") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_delete({ Filter::make_or({}) }, uat);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error() ==
              OperationError::schema_violation(SchemaError::Kind::EmptyFilter));
    }
  }

  GIVEN("A filter without matches") {
    THEN("delete fails with NoMatchingEntries") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_delete({ Filter::make_eq("name", "nobody") }, uat);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::NoMatchingEntries);
    }
  }

  GIVEN("No token") {
    THEN("delete and revive are not allowed") {
      REQUIRE(t.server.handle_delete({ Filter::make_eq("name", "mail") },
                                     anonymous_caller).error().kind()
              == OperationError::Kind::NotAuthenticated);
      REQUIRE(t.server.handle_revive_recycled({ Filter::make_eq("name", "mail") },
                                              anonymous_caller).error().kind()
              == OperationError::Kind::NotAuthenticated);
    }
  }

  WHEN("the application is deleted") {
    REQUIRE(t.server.handle_delete({ Filter::make_eq("name", "mail") }, uat).ok());

    THEN("it is only found among the recycled entries") {
      REQUIRE(t.count(Filter::make_eq("name", "mail")) == 0);
      idm::Result<idm::SearchResponse> recycled =
        t.server.handle_search_recycled({ Filter::make_eq("name", "mail") }, anonymous_caller);
      REQUIRE(recycled.ok());
      REQUIRE(recycled->entries.size() == 1);
    }

    AND_WHEN("it is revived") {
      REQUIRE(t.server.handle_revive_recycled({ Filter::make_eq("name", "mail") }, uat).ok());

      THEN("it is live again") {
        REQUIRE(t.count(Filter::make_eq("name", "mail")) == 1);
        REQUIRE(t.server.verify().ok());
      }
    }

    AND_WHEN("a recycled entry that does not exist is revived") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_revive_recycled({ Filter::make_eq("name", "staff") }, uat);

      THEN("it fails with NoMatchingEntries") {
        REQUIRE(!resp.ok());
        REQUIRE(resp.error().kind() == OperationError::Kind::NoMatchingEntries);
      }
    }
  }
}

SCENARIO( "Modifying entries", "[server]" ) {
  TestServer t;
  idm::UserAuthToken uat = t.login();
  Filter alice = Filter::make_eq("name", "alice");

  GIVEN("An empty modification list") {
    THEN("modify fails with EmptyRequest") {
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_modify({ alice, ModifyList{} }, uat);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::EmptyRequest);
    }
  }

  GIVEN("A modification of the uuid") {
    ModifyList ml{{ Modify::purged("uuid") }};

    THEN("modify fails with SystemProtectedObject") {
      idm::Result<idm::OperationResponse> resp = t.server.handle_modify({ alice, ml }, uat);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::SystemProtectedObject);
    }
  }

  GIVEN("A new mail address") {
    ModifyList ml{{ Modify::present("mail", "alice@example.com") }};

    THEN("the entry is updated") {
      REQUIRE(t.server.handle_modify({ alice, ml }, uat).ok());
      REQUIRE(t.count(Filter::make_eq("mail", "alice@example.com")) == 1);
    }

    THEN("SelfUUID selects the caller") {
      REQUIRE(t.server.handle_modify({ Filter::make_self(), ml }, uat).ok());
      REQUIRE(t.count(Filter::make_eq("mail", "alice@example.com")) == 1);
    }

    THEN("a mail address followed by purge leaves no mail") {
      ModifyList both{{ Modify::present("mail", "x@y"), Modify::purged("mail") }};
      REQUIRE(t.server.handle_modify({ alice, both }, uat).ok());
      REQUIRE(t.count(Filter::make_pres("mail")) == 0);
    }
  }

  GIVEN("The removal of a required attribute") {
    ModifyList ml{{ Modify::purged("displayname") }};

    THEN("modify fails with a schema violation and changes nothing") {
      idm::Result<idm::OperationResponse> resp = t.server.handle_modify({ alice, ml }, uat);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error() ==
              OperationError::schema_violation(SchemaError::missing_must_attribute("displayname")));
      REQUIRE(t.count(Filter::make_pres("displayname")) == 1);
    }
  }

  GIVEN("Two clients adding mail addresses at the same time") {
    const int rounds = 50;
    auto add_mail = [&t, &uat, &alice, rounds](const std::string &prefix) {
      for (int n = 0; n < rounds; n++) {
        ModifyList ml{{ Modify::present("mail", prefix + std::to_string(n) + "@example.com") }};
        if (!t.server.handle_modify({ alice, ml }, uat).ok()) {
          return false;
        }
      }
      return true;
    };

    auto first = std::async(std::launch::async, add_mail, "a");
    auto second = std::async(std::launch::async, add_mail, "b");
    bool first_ok = first.get();
    bool second_ok = second.get();

    THEN("no address is lost") {
      REQUIRE(first_ok);
      REQUIRE(second_ok);
      idm::Result<idm::SearchResponse> resp =
        t.server.handle_search({ alice }, anonymous_caller);
      REQUIRE(resp.ok());
      REQUIRE(resp->entries.size() == 1);
      REQUIRE(resp->entries.front().get("mail")->size() == static_cast<size_t>(2 * rounds));
    }
  }

  GIVEN("No token") {
    THEN("modify is not allowed") {
      ModifyList ml{{ Modify::present("mail", "x@y") }};
      idm::Result<idm::OperationResponse> resp =
        t.server.handle_modify({ alice, ml }, anonymous_caller);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::NotAuthenticated);
    }
  }
}

SCENARIO( "Tokens and whoami", "[server]" ) {
  TestServer t;

  GIVEN("The token of alice") {
    idm::UserAuthToken uat = t.login();

    THEN("it carries her names and groups") {
      REQUIRE(uat.name == "alice");
      REQUIRE(uat.displayname == "Alice");
      REQUIRE(uat.uuid == alice_uuid);
      REQUIRE(uat.groups.size() == 1);
      REQUIRE(uat.groups.front() == idm::Group{ "staff", staff_uuid });
      REQUIRE(!uat.application.has_value());
    }

    THEN("whoami returns her entry") {
      idm::Result<idm::WhoamiResponse> resp = t.server.handle_whoami({}, uat);
      REQUIRE(resp.ok());
      REQUIRE(resp->youare.uuid() == alice_uuid);
      REQUIRE(resp->uat == uat);
    }
  }

  GIVEN("A known application") {
    idm::UserAuthToken uat = t.login(std::string("mail"));

    THEN("the token is bound to it") {
      REQUIRE(uat.application.has_value());
      REQUIRE(*uat.application == idm::Application{ "mail", mail_uuid });
    }
  }

  GIVEN("An unknown application") {
    test_log_off();
    idm::Result<idm::AuthResponse> init =
      t.server.handle_auth({ AuthStep::make_init("alice", std::string("calendar")),
                             std::nullopt });
    REQUIRE(init.ok());
    idm::Result<idm::AuthResponse> resp =
      t.server.handle_auth({ AuthStep::make_creds({ AuthCredential::anonymous() }),
                             init->sessionid });
    test_log_on();

    THEN("the session is denied") {
      REQUIRE(resp.ok());
      REQUIRE(resp->state.kind == idm::AuthState::Kind::Denied);
      REQUIRE(!t.server.session_token(resp->sessionid).has_value());
    }
  }

  GIVEN("No token") {
    THEN("whoami is not allowed") {
      idm::Result<idm::WhoamiResponse> resp = t.server.handle_whoami({}, anonymous_caller);
      REQUIRE(!resp.ok());
      REQUIRE(resp.error().kind() == OperationError::Kind::NotAuthenticated);
    }
  }
}

SCENARIO( "Consistency verification", "[server]" ) {
  TestServer t;

  GIVEN("The seeded backend") {
    THEN("all checks pass") {
      REQUIRE(t.server.verify().ok());
    }
  }

  GIVEN("A group with a member that does not exist") {
    REQUIRE(t.backend.create({ Entry{idm::Attrs{
              { "class", { "group" } },
              { "name", { "ghosts" } },
              { "member", { test_uuid(99) } },
              { "uuid", { test_uuid(5) } } }} }).ok());

    THEN("verification reports the broken reference") {
      test_log_off();
      idm::Result<void> res = t.server.verify();
      test_log_on();
      REQUIRE(!res.ok());
      REQUIRE(res.error().kind() == OperationError::Kind::ConsistencyError);

      const auto &checks = res.error().consistency_results();
      REQUIRE(std::any_of(checks.begin(), checks.end(),
                          [](const idm::ConsistencyResult &r) {
                            return !r.ok()
                              && r.error().kind() == idm::ConsistencyError::Kind::RefintNotUpheld;
                          }));
    }
  }
}
