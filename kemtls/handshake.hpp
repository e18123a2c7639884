#pragma once

#include "channel.hpp"
#include "client.hpp"
#include "server.hpp"

namespace pqoidc {

// Drive the full 4-message exchange over a channel. On a handshake failure
// an ALERT is sent to the peer when the channel still works, then the
// original error is rethrown. Any other exception (I/O, liboqs) aborts the
// state machine and propagates unchanged.
Session perform_client_handshake(KemtlsClient &client, MessageChannel &channel);
Session perform_server_handshake(KemtlsServer &server, MessageChannel &channel);

} // namespace pqoidc
