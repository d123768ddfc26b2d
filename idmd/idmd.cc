/*
 * idmd.cc -- IDM query server
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 *
 * Parts of the server code are taken from the libcoap server example.
 */

#include <memory>
#include <string>

#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <netdb.h>
#include <signal.h>
#include <unistd.h>

#include <coap2/coap.h>

#include "idm/idm.hh"
#include "idm/accounts.hh"
#include "idm/idm_json.hh"
#include "idm/memory_backend.hh"
#include "idm/schema.hh"
#include "config_parser.hh"

#define COAP_RESOURCE_CHECK_TIME 2

#define IDMD_VERSION "0.3.0"

static void
usage(const char *program, const char *version) {
  const char *p;

  p = strrchr(program, '/');
  if (p)
    program = ++p;

  fprintf(stderr, "%s v%s -- IDM query server\n"
          "(c) 2019-2021 The libidm authors\n\n"
          "usage: %s [-A address] [-C file] [-p port] [-v num]\n\n"
          "\t-A address\tinterface address to bind to\n"
          "\t-C file\t\tload configuration file\n"
          "\t-p port\t\tlisten on specified port\n"
          "\t-v num\t\tverbosity level (default: 4)\n",
          program, version, program);
}

/* Set to true if SIGINT or SIGTERM are caught. The main loop will
 * exit gracefully if quit == true. */
static bool quit = false;

/* SIGINT handler: set quit to 1 for graceful termination */
static void
handle_sigint(int signum) {
  (void)signum;
  quit = true;
}

/* The server that handles all requests. Set by main(). */
static idm::QueryServer *server = nullptr;

static uint8_t
response_code(const idm::OperationError &err) {
  using Kind = idm::OperationError::Kind;

  switch (err.kind()) {
  case Kind::NotAuthenticated:
    return COAP_RESPONSE_CODE(401);
  case Kind::AccessDenied:
    return COAP_RESPONSE_CODE(403);
  case Kind::NoMatchingEntries:
    return COAP_RESPONSE_CODE(404);
  case Kind::EmptyRequest:
  case Kind::ConsistencyError:
  case Kind::SchemaViolation:
  case Kind::FilterGeneration:
  case Kind::FilterUUIDResolution:
  case Kind::InvalidAttributeName:
  case Kind::InvalidAttribute:
  case Kind::InvalidUuid:
  case Kind::SerdeJsonError:
  case Kind::InvalidAuthState:
  case Kind::InvalidSessionState:
  case Kind::SystemProtectedObject:
    return COAP_RESPONSE_CODE(400);
  default:
    return COAP_RESPONSE_CODE(500);
  }
}

static void
set_payload(coap_pdu_t *response, uint8_t code, const std::string &payload) {
  unsigned char buf[3];

  response->code = code;
  coap_add_option(response, COAP_OPTION_CONTENT_FORMAT,
                  coap_encode_var_safe(buf, sizeof(buf),
                                       COAP_MEDIATYPE_APPLICATION_JSON),
                  buf);
  coap_add_data(response, payload.size(),
                reinterpret_cast<const uint8_t *>(payload.data()));
}

static void
set_error(coap_pdu_t *response, const idm::OperationError &err) {
  idm::Result<std::string> text = idm::json::serialize(err);

  idm_log(IDM_LOG_DEBUG, "request failed: %s\n", err.name());
  if (!text) {
    response->code = COAP_RESPONSE_CODE(500);
    return;
  }
  set_payload(response, response_code(err), *text);
}

template <typename T>
static void
set_result(coap_pdu_t *response, const idm::Result<T> &result) {
  if (!result) {
    set_error(response, result.error());
    return;
  }

  idm::Result<std::string> text = idm::json::serialize(*result);
  if (!text) {
    set_error(response, text.error());
    return;
  }
  set_payload(response, COAP_RESPONSE_CODE(205), *text);
}

static std::string
payload(coap_pdu_t *request) {
  size_t len;
  uint8_t *data;

  if (!coap_get_data(request, &len, &data)) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(data), len);
}

/* Returns the token of the session named in the URI query, if any. */
static std::optional<idm::UserAuthToken>
caller(coap_string_t *query) {
  static const std::string key = IDM_SESSION_QUERY;

  if (!query) {
    return std::nullopt;
  }

  std::string q(reinterpret_cast<const char *>(query->s), query->length);
  size_t start = 0;
  while (start <= q.size()) {
    size_t end = q.find('&', start);
    if (end == std::string::npos) {
      end = q.size();
    }
    if (q.compare(start, key.size(), key) == 0) {
      auto id = idm::Uuid::parse(q.substr(start + key.size(), end - start - key.size()));
      return id ? server->session_token(*id) : std::nullopt;
    }
    start = end + 1;
  }
  return std::nullopt;
}

/* Decodes the payload of @p request and passes it to @p handle
 * together with the token of the caller. */
template <typename Request, typename Decoder, typename Handler>
static void
dispatch(coap_pdu_t *request, coap_string_t *query, coap_pdu_t *response,
         Decoder decode, Handler handle) {
  idm::Result<Request> req =
    idm::json::deserialize<Request>(payload(request), decode);
  if (!req) {
    set_error(response, req.error());
    return;
  }
  set_result(response, handle(*req, caller(query)));
}

static void
hnd_search(coap_context_t *ctx,
           struct coap_resource_t *resource,
           coap_session_t *session,
           coap_pdu_t *request,
           coap_binary_t *token,
           coap_string_t *query,
           coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::SearchRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_search_request(j, server->max_filter_depth());
    },
    [](const idm::SearchRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_search(req, uat);
    });
}

static void
hnd_create(coap_context_t *ctx,
           struct coap_resource_t *resource,
           coap_session_t *session,
           coap_pdu_t *request,
           coap_binary_t *token,
           coap_string_t *query,
           coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::CreateRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_create_request(j);
    },
    [](const idm::CreateRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_create(req, uat);
    });
}

static void
hnd_delete(coap_context_t *ctx,
           struct coap_resource_t *resource,
           coap_session_t *session,
           coap_pdu_t *request,
           coap_binary_t *token,
           coap_string_t *query,
           coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::DeleteRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_delete_request(j, server->max_filter_depth());
    },
    [](const idm::DeleteRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_delete(req, uat);
    });
}

static void
hnd_modify(coap_context_t *ctx,
           struct coap_resource_t *resource,
           coap_session_t *session,
           coap_pdu_t *request,
           coap_binary_t *token,
           coap_string_t *query,
           coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::ModifyRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_modify_request(j, server->max_filter_depth());
    },
    [](const idm::ModifyRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_modify(req, uat);
    });
}

static void
hnd_search_recycled(coap_context_t *ctx,
                    struct coap_resource_t *resource,
                    coap_session_t *session,
                    coap_pdu_t *request,
                    coap_binary_t *token,
                    coap_string_t *query,
                    coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::SearchRecycledRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_search_recycled_request(j, server->max_filter_depth());
    },
    [](const idm::SearchRecycledRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_search_recycled(req, uat);
    });
}

static void
hnd_revive_recycled(coap_context_t *ctx,
                    struct coap_resource_t *resource,
                    coap_session_t *session,
                    coap_pdu_t *request,
                    coap_binary_t *token,
                    coap_string_t *query,
                    coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;

  dispatch<idm::ReviveRecycledRequest>(request, query, response,
    [](const json_t *j) {
      return idm::json::decode_revive_recycled_request(j, server->max_filter_depth());
    },
    [](const idm::ReviveRecycledRequest &req, const std::optional<idm::UserAuthToken> &uat) {
      return server->handle_revive_recycled(req, uat);
    });
}

static void
hnd_auth(coap_context_t *ctx,
         struct coap_resource_t *resource,
         coap_session_t *session,
         coap_pdu_t *request,
         coap_binary_t *token,
         coap_string_t *query,
         coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)token;
  (void)query;

  idm::Result<idm::AuthRequest> req =
    idm::json::deserialize<idm::AuthRequest>(payload(request),
                                             idm::json::decode_auth_request);
  if (!req) {
    set_error(response, req.error());
    return;
  }
  set_result(response, server->handle_auth(*req));
}

static void
hnd_whoami(coap_context_t *ctx,
           struct coap_resource_t *resource,
           coap_session_t *session,
           coap_pdu_t *request,
           coap_binary_t *token,
           coap_string_t *query,
           coap_pdu_t *response) {
  (void)ctx;
  (void)resource;
  (void)session;
  (void)request;
  (void)token;

  set_result(response, server->handle_whoami(idm::WhoamiRequest{}, caller(query)));
}

static void
init_resources(coap_context_t *coap_context) {
  static const struct {
    const char *path;
    coap_method_handler_t handler;
  } resources[] = {
    { "v1/search",           hnd_search },
    { "v1/create",           hnd_create },
    { "v1/delete",           hnd_delete },
    { "v1/modify",           hnd_modify },
    { "v1/auth",             hnd_auth },
    { "v1/whoami",           hnd_whoami },
    { "v1/recycled/search",  hnd_search_recycled },
    { "v1/recycled/revive",  hnd_revive_recycled },
  };

  for (const auto &r : resources) {
    coap_resource_t *resource = coap_resource_init(coap_make_str_const(r.path), 0);
    coap_register_handler(resource, COAP_REQUEST_POST, r.handler);
    coap_add_attr(resource, coap_make_str_const("ct"),
                  coap_make_str_const("50"), 0);
    coap_add_resource(coap_context, resource);
  }
}

static coap_context_t *
get_context(const char *node, uint16_t port) {
  coap_context_t *ctx = coap_new_context(nullptr);
  struct addrinfo hints;
  struct addrinfo *result, *rp;
  char service[8];

  if (!ctx) {
    return nullptr;
  }

  memset(&hints, 0, sizeof(struct addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST;
  snprintf(service, sizeof(service), "%u", port);

  if (getaddrinfo(node, service, &hints, &result) != 0) {
    idm_log(IDM_LOG_ERR, "cannot resolve %s\n", node);
    coap_free_context(ctx);
    return nullptr;
  }

  for (rp = result; rp != nullptr; rp = rp->ai_next) {
    coap_address_t addr;

    if (rp->ai_addrlen > sizeof(addr.addr)) {
      continue;
    }
    coap_address_init(&addr);
    addr.size = rp->ai_addrlen;
    memcpy(&addr.addr, rp->ai_addr, rp->ai_addrlen);

    if (coap_new_endpoint(ctx, &addr, COAP_PROTO_UDP)) {
      freeaddrinfo(result);
      return ctx;
    }
  }

  idm_log(IDM_LOG_ERR, "cannot bind to %s port %u\n", node, port);
  freeaddrinfo(result);
  coap_free_context(ctx);
  return nullptr;
}

int
main(int argc, char **argv) {
  coap_context_t *ctx;
  std::string addr_str = "::1";
  uint16_t port = 0;
  int opt;
  coap_log_t log_level = LOG_WARNING;
  unsigned wait_ms;
  std::string config_file = idm_config::getDefaultConfigFile();
  idm_config::parser parser;
  struct sigaction sa;

  while ((opt = getopt(argc, argv, "A:C:p:v:")) != -1) {
    switch (opt) {
    case 'A':
      addr_str = optarg;
      break;
    case 'C':
      config_file = optarg;
      break;
    case 'p':
      port = static_cast<uint16_t>(strtol(optarg, nullptr, 10));
      break;
    case 'v':
      log_level = static_cast<coap_log_t>(strtol(optarg, nullptr, 10));
      break;
    default:
      usage(argv[0], IDMD_VERSION);
      exit(1);
    }
  }

  coap_startup();
  coap_set_log_level(log_level);
  idm_set_log_level(static_cast<idm_log_t>(log_level));

  if (!config_file.empty() && !parser.parseFile(config_file)) {
    fprintf(stderr, "Invalid configuration '%s'\n", config_file.c_str());
    exit(3);
  }

  /* the command line takes precedence over the configuration */
  if (!parser.endpoints.empty()) {
    if (addr_str == "::1") {
      addr_str = parser.endpoints.front().interface;
    }
    if (!port) {
      port = parser.endpoints.front().port;
    }
  }
  if (!port) {
    port = IDM_DEFAULT_COAP_PORT;
  }

  idm::Schema schema = idm::core_schema();
  for (const auto &cls : parser.classes) {
    schema.add_class(cls);
  }

  idm::AccountStore accounts;
  for (const auto &account : parser.accounts) {
    accounts.add(account);
  }

  idm::MemoryBackend backend;
  idm::Entries seed;
  for (const auto &e : parser.entries) {
    idm::Result<void, idm::SchemaError> valid = schema.validate(e);
    if (!valid) {
      idm_log(IDM_LOG_ERR, "seed entry %s: schema violation %s\n",
              e.uuid().value_or("(no uuid)").c_str(), valid.error().name());
      exit(3);
    }
    seed.push_back(e);
  }
  idm::Result<void> created = backend.create(seed);
  if (!created) {
    idm_log(IDM_LOG_ERR, "cannot store seed entries: %s\n", created.error().name());
    exit(3);
  }

  idm::QueryServer query_server(backend, schema, accounts,
                                std::chrono::seconds(parser.session_timeout),
                                parser.max_filter_depth);
  server = &query_server;

  idm::Result<void> consistent = query_server.verify();
  if (!consistent) {
    idm_log(IDM_LOG_WARNING, "seed entries are not consistent\n");
  }

  ctx = get_context(addr_str.c_str(), port);
  if (!ctx)
    return -1;

  init_resources(ctx);

  memset (&sa, 0, sizeof(sa));
  sigemptyset(&sa.sa_mask);
  sa.sa_handler = handle_sigint;
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, NULL);
  sigaction(SIGTERM, &sa, NULL);

  idm_log(IDM_LOG_NOTICE, "listening on [%s]:%u\n", addr_str.c_str(), port);
  wait_ms = COAP_RESOURCE_CHECK_TIME * 1000;

  while (!quit) {
    int result;
#if !defined(LIBCOAP_VERSION) || (LIBCOAP_VERSION < 4003000)
    result = coap_run_once(ctx, wait_ms);
#else /* LIBCOAP_VERSION >= 4003000 */
    result = coap_io_process(ctx, wait_ms);
#endif  /* LIBCOAP_VERSION >= 4003000 */
    if ( result < 0 ) {
      break;
    } else if ((unsigned)result < wait_ms) {
      wait_ms -= result;
    } else {
      query_server.sessions().expire();
      wait_ms = COAP_RESOURCE_CHECK_TIME * 1000;
    }
  }

  server = nullptr;
  coap_free_context(ctx);
  coap_cleanup();

  return 0;
}
