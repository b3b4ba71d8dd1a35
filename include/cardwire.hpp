#pragma once

/*
===============================================================================
cardwire - Public API Entry Point
===============================================================================

Real-time channel clients for the card platform:

  cardwire::Chat        project chat           /api/ws/chat/{project}
  cardwire::Direct      direct messages        /api/ws/dm
  cardwire::Generation  AI content stream      /api/ws/cards/{card}

All three run on the Boost.Beast transport and the steady clock. The
templates under cardwire::client accept any transport satisfying
transport::WebSocketConcept.
===============================================================================
*/

#include "cardwire/client/chat.hpp"
#include "cardwire/client/direct.hpp"
#include "cardwire/client/generation.hpp"
#include "cardwire/core/transport/beast/websocket.hpp"


namespace cardwire {

using Chat       = client::ChatClient<core::transport::beast::WebSocket>;
using Direct     = client::DirectClient<core::transport::beast::WebSocket>;
using Generation = client::GenerationClient<core::transport::beast::WebSocket>;

} // namespace cardwire
