/*
 * test_json.cc -- JSON encoding of protocol values
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include "test.hh"
#include <catch2/catch.hpp>

using idm::Filter;
namespace json = idm::json;

static Filter
decode_filter_text(const std::string &text,
                   size_t max_depth = IDM_FILTER_MAX_DEPTH) {
  idm::Result<Filter> f =
    json::deserialize<Filter>(text, [max_depth](const json_t *j) {
        return json::decode_filter(j, max_depth);
      });
  REQUIRE(f.ok());
  return *f;
}

static idm::OperationError
decode_filter_error(const std::string &text,
                    size_t max_depth = IDM_FILTER_MAX_DEPTH) {
  test_log_off();
  idm::Result<Filter> f =
    json::deserialize<Filter>(text, [max_depth](const json_t *j) {
        return json::decode_filter(j, max_depth);
      });
  test_log_on();
  REQUIRE(!f.ok());
  return f.error();
}

SCENARIO( "Filter wire format", "[json]" ) {
  GIVEN("A filter using every variant") {
    Filter f = Filter::make_and({
        Filter::make_eq("class", "person"),
        Filter::make_or({ Filter::make_sub("name", "al"),
                          Filter::make_pres("mail") }),
        Filter::make_andnot(Filter::make_self()) });

    WHEN("it is serialized") {
      idm::Result<std::string> text = json::serialize(f);
      REQUIRE(text.ok());

      THEN("variants are tagged by name") {
        REQUIRE(*text ==
                "{\"And\":[{\"Eq\":[\"class\",\"person\"]},"
                "{\"Or\":[{\"Sub\":[\"name\",\"al\"]},{\"Pres\":\"mail\"}]},"
                "{\"AndNot\":\"Self\"}]}");
      }

      THEN("it decodes to an equal filter") {
        REQUIRE(decode_filter_text(*text) == f);
      }
    }
  }

  GIVEN("The empty combinators") {
    THEN("they are encoded as empty lists") {
      REQUIRE(*json::serialize(Filter::make_and({})) == "{\"And\":[]}");
      REQUIRE(*json::serialize(Filter::make_or({})) == "{\"Or\":[]}");
      REQUIRE(decode_filter_text("{\"Or\":[]}").is_always_false());
    }
  }

  GIVEN("Malformed filters") {
    THEN("decoding fails with SerdeJsonError") {
      using Kind = idm::OperationError::Kind;
      REQUIRE(decode_filter_error("{\"Eq\":[\"a\"]}").kind() == Kind::SerdeJsonError);
      REQUIRE(decode_filter_error("{\"Eq\":[\"a\",1]}").kind() == Kind::SerdeJsonError);
      REQUIRE(decode_filter_error("{\"Like\":\"a\"}").kind() == Kind::SerdeJsonError);
      REQUIRE(decode_filter_error("\"Pres\"").kind() == Kind::SerdeJsonError);
      REQUIRE(decode_filter_error("{\"Eq\":[\"a\",\"b\"],\"Pres\":\"c\"}").kind()
              == Kind::SerdeJsonError);
      REQUIRE(decode_filter_error("{\"And\":[").kind() == Kind::SerdeJsonError);
    }
  }

  GIVEN("A filter nested deeper than the limit") {
    std::string text = "{\"Pres\":\"a\"}";
    for (int n = 0; n < 3; n++) {
      text = "{\"AndNot\":" + text + "}";
    }

    THEN("decoding fails with FilterGeneration") {
      REQUIRE(decode_filter_error(text, 3).kind()
              == idm::OperationError::Kind::FilterGeneration);
      REQUIRE(decode_filter_text(text, 4).depth() == 4);
    }
  }
}

SCENARIO( "Entry and modification wire format", "[json]" ) {
  GIVEN("An entry") {
    idm::Entry e{idm::Attrs{ { "class", { "person" } },
                             { "name", { "alice" } } }};

    THEN("it is encoded as map of attribute lists") {
      REQUIRE(*json::serialize(e) ==
              "{\"attrs\":{\"class\":[\"person\"],\"name\":[\"alice\"]}}");
    }
  }

  GIVEN("A modification list") {
    idm::ModifyList ml{{ idm::Modify::present("mail", "a@example.com"),
                         idm::Modify::removed("mail", "b@example.com"),
                         idm::Modify::purged("mail") }};

    WHEN("it is serialized") {
      idm::Result<std::string> text = json::serialize(ml);
      REQUIRE(text.ok());

      THEN("each modification is tagged") {
        REQUIRE(*text ==
                "{\"mods\":[{\"Present\":[\"mail\",\"a@example.com\"]},"
                "{\"Removed\":[\"mail\",\"b@example.com\"]},"
                "{\"Purged\":\"mail\"}]}");
      }

      THEN("it decodes to an equal list") {
        idm::Result<idm::ModifyList> back =
          json::deserialize<idm::ModifyList>(*text, json::decode_modify_list);
        REQUIRE(back.ok());
        REQUIRE(*back == ml);
      }
    }
  }
}

SCENARIO( "Authentication wire format", "[json]" ) {
  GIVEN("An initial request") {
    idm::AuthRequest req{ idm::AuthStep::make_init("alice"), std::nullopt };

    THEN("the application and the session id are null") {
      REQUIRE(*json::serialize(req) ==
              "{\"step\":{\"Init\":[\"alice\",null]},\"sessionid\":null}");
    }
  }

  GIVEN("A credential request") {
    idm::Uuid id = *idm::Uuid::parse(test_uuid(7));
    idm::AuthRequest req{ idm::AuthStep::make_creds({ idm::AuthCredential::anonymous(),
                                                      idm::AuthCredential::password("pw") }),
                          id };

    WHEN("it is serialized") {
      idm::Result<std::string> text = json::serialize(req);
      REQUIRE(text.ok());

      THEN("unit credentials are plain strings") {
        REQUIRE(*text ==
                "{\"step\":{\"Creds\":[\"Anonymous\",{\"Password\":\"pw\"}]},"
                "\"sessionid\":\"" + test_uuid(7) + "\"}");
      }

      THEN("it decodes to an equal request") {
        idm::Result<idm::AuthRequest> back =
          json::deserialize<idm::AuthRequest>(*text, json::decode_auth_request);
        REQUIRE(back.ok());
        REQUIRE(back->step == req.step);
        REQUIRE(back->sessionid == req.sessionid);
      }
    }
  }

  GIVEN("A successful response") {
    idm::UserAuthToken uat;
    uat.name = "alice";
    uat.displayname = "Alice";
    uat.uuid = test_uuid(1);
    uat.groups.push_back(idm::Group{ "staff", test_uuid(2) });
    idm::AuthResponse resp{ *idm::Uuid::parse(test_uuid(9)),
                            idm::AuthState::make_success(uat) };

    THEN("the token survives the round trip") {
      idm::Result<std::string> text = json::serialize(resp);
      REQUIRE(text.ok());
      idm::Result<idm::AuthResponse> back =
        json::deserialize<idm::AuthResponse>(*text, json::decode_auth_response);
      REQUIRE(back.ok());
      REQUIRE(back->sessionid == resp.sessionid);
      REQUIRE(back->state == resp.state);
    }
  }

  GIVEN("A continue response") {
    idm::AuthState state = idm::AuthState::make_continue({ idm::AuthAllowed::Anonymous });

    THEN("the mechanisms are listed by name") {
      REQUIRE(*json::serialize(state) == "{\"Continue\":[\"Anonymous\"]}");
    }
  }

  GIVEN("A session id that is not a uuid") {
    THEN("the request is rejected") {
      test_log_off();
      idm::Result<idm::AuthRequest> req =
        json::deserialize<idm::AuthRequest>("{\"step\":{\"Creds\":[]},\"sessionid\":\"x\"}",
                                            json::decode_auth_request);
      test_log_on();
      REQUIRE(!req.ok());
      REQUIRE(req.error().kind() == idm::OperationError::Kind::SerdeJsonError);
    }
  }
}

SCENARIO( "Error wire format", "[json]" ) {
  using idm::ConsistencyError;
  using idm::OperationError;
  using idm::SchemaError;

  GIVEN("A schema violation") {
    OperationError err =
      OperationError::schema_violation(SchemaError::missing_must_attribute("name"));

    THEN("the nested error is tagged") {
      REQUIRE(*json::serialize(err) ==
              "{\"SchemaViolation\":{\"MissingMustAttribute\":\"name\"}}");
    }
  }

  GIVEN("A consistency failure") {
    OperationError err = OperationError::consistency({
        idm::ConsistencyResult{},
        idm::ConsistencyResult{ ConsistencyError::uuid_not_unique(test_uuid(3)) },
        idm::ConsistencyResult{ ConsistencyError::refint_not_upheld(5) } });

    WHEN("it is serialized") {
      idm::Result<std::string> text = json::serialize(err);
      REQUIRE(text.ok());

      THEN("each check is an Ok or an Err") {
        REQUIRE(*text ==
                "{\"ConsistencyError\":[{\"Ok\":null},"
                "{\"Err\":{\"UuidNotUnique\":\"" + test_uuid(3) + "\"}},"
                "{\"Err\":{\"RefintNotUpheld\":5}}]}");
      }

      THEN("it decodes to an equal error") {
        idm::Result<json::Ptr> j = json::parse(*text);
        REQUIRE(j.ok());
        std::optional<OperationError> back = json::decode_operation_error(j->get());
        REQUIRE(back.has_value());
        REQUIRE(*back == err);
      }
    }
  }

  GIVEN("Unit variants") {
    THEN("they are plain strings") {
      REQUIRE(*json::serialize(OperationError{OperationError::Kind::NotAuthenticated})
              == "\"NotAuthenticated\"");
      REQUIRE(*json::serialize(OperationError::corrupted_entry(5))
              == "{\"CorruptedEntry\":5}");
      REQUIRE(*json::serialize(ConsistencyError::schema_class_missing_attribute("person", "name"))
              == "{\"SchemaClassMissingAttribute\":[\"person\",\"name\"]}");
    }

    THEN("a payload where none belongs is rejected") {
      idm::Result<json::Ptr> j = json::parse("{\"EmptyRequest\":\"x\"}");
      REQUIRE(j.ok());
      REQUIRE(!json::decode_operation_error(j->get()).has_value());
    }
  }
}

SCENARIO( "Malformed JSON text", "[json]" ) {
  GIVEN("Text that is not JSON") {
    THEN("parsing fails with SerdeJsonError") {
      test_log_off();
      idm::Result<json::Ptr> j = json::parse("{\"filter\":");
      test_log_on();
      REQUIRE(!j.ok());
      REQUIRE(j.error().kind() == idm::OperationError::Kind::SerdeJsonError);
    }
  }

  GIVEN("A search request without filter") {
    THEN("decoding fails with SerdeJsonError") {
      test_log_off();
      idm::Result<idm::SearchRequest> req =
        json::deserialize<idm::SearchRequest>("{}", [](const json_t *j) {
            return json::decode_search_request(j);
          });
      test_log_on();
      REQUIRE(!req.ok());
      REQUIRE(req.error().kind() == idm::OperationError::Kind::SerdeJsonError);
    }
  }
}
