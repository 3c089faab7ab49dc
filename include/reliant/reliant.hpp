#pragma once

// Reliant - reliable CoAP message delivery over unreliable datagram links
// The engine retransmits confirmable messages with exponential backoff until they are
// acknowledged, rejected or abandoned, and routes responses back by MID and token.

// Core types and utilities
#include <reliant/common.hpp>
#include <reliant/endpoint.hpp>
#include <reliant/transport.hpp>

// Transports
#include <reliant/transport/udp.hpp>
#include <reliant/transport/xbee.hpp>

// Message layer
#include <reliant/coap/codec.hpp>
#include <reliant/coap/defines.hpp>
#include <reliant/coap/message.hpp>

// Delivery engine
#include <reliant/engine/engine.hpp>
#include <reliant/engine/layers.hpp>
#include <reliant/engine/metrics.hpp>
#include <reliant/engine/signal.hpp>
#include <reliant/engine/state.hpp>
#include <reliant/engine/transaction.hpp>

// Blocking helper
#include <reliant/client.hpp>

// All types are in the reliant:: namespace
// Available types:
//   - reliant::Buffer (dp::Vector<dp::u8>)
//   - reliant::UdpEndpoint, SerialEndpoint, XBeeAddress
//   - reliant::UdpTransport, XBeeTransport
//   - reliant::coap::Message, coap::encode, coap::decode
//   - reliant::Engine<T>, Client<T>
