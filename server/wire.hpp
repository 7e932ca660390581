#pragma once
#include <string>
#include "game.hpp"
#include "outbound.hpp"

#include "ms/v1/ms.pb.h"

namespace MS {

/** Domain message -> server event envelope. */
ms::v1::Envelope toWire(const Outbound& m);

ms::v1::ErrorCode toWire(ErrorCode c);
void fillGameInfo(const Game& g, ms::v1::GameInfo* out);

GameInit     fromWire(const ms::v1::GameInit& in);
PlayerConfig fromWire(const ms::v1::PlayerConfig& in);
GameConfig   fromWire(const ms::v1::GameConfig& in);

/**
 * Host part of a gRPC peer string:
 * "ipv4:10.0.0.2:5000" -> "10.0.0.2", "ipv6:[::1]:5000" and
 * "ipv6:%5B::1%5D:5000" -> "::1".
 */
std::string peerHost(const std::string& peer);

} // namespace MS
