// This is the single entry point for the VaultWire library.
// Include this file to get access to the core public API.

#pragma once

// Session and request/response client
#include "vaultwire/core/session/authenticated_session.hpp"
#include "vaultwire/core/client/protocol_client.hpp"

// Configuration
#include "vaultwire/core/config/client_config.hpp"

// Core data types and wire format
#include "vaultwire/core/types.hpp"
#include "vaultwire/core/protocol/message.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/protocol/frame_reader.hpp"

// Key material
#include "vaultwire/core/crypto/rsa_keypair.hpp"

// Public interfaces for extension
#include "vaultwire/core/interfaces/itransport.hpp"
#include "vaultwire/core/interfaces/ICertificateVerifier.hpp"

// Built-in transports and certificate policies
#include "vaultwire/transports/tcp/tcp_transport.hpp"
#include "vaultwire/transports/tls/tls_transport.hpp"
#include "vaultwire/core/util/SystemTrustVerifier.hpp"
#include "vaultwire/core/util/PinnedCertificateVerifier.hpp"

// Utilities
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include "vaultwire/core/util/base64.hpp"
#include "vaultwire/core/util/hex.hpp"
