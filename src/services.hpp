#pragma once

#include "config.hpp"
#include "instance_lock.hpp"
#include "mailbox.hpp"
#include "path_translator.hpp"
#include "process_probe.hpp"
#include "session_authority.hpp"
#include "tooling.hpp"

namespace deskbridge {

// Everything a request handler may touch. Owned by main (or a test fixture)
// and passed down explicitly; null members are simply unavailable.
struct GatewayServices {
  const GatewayConfig* config = nullptr;
  ToolRegistry* registry = nullptr;
  SessionAuthority* sessions = nullptr;
  MailboxBridge* bridge = nullptr;
  const PathTranslator* translator = nullptr;
  const ProcessProbe* probe = nullptr;
  const InstanceLock* lock = nullptr;
  PathSyntax local_syntax = PathSyntax::kGuest;
  PathSyntax peer_syntax = PathSyntax::kHost;
};

}  // namespace deskbridge
