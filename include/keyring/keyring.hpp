#pragma once

/// @file keyring.hpp
/// @brief Umbrella header for embedding the keyring signing-key service.

#include "keyring/version.hpp"

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/config_manager.hpp"
#include "keyring/foundation/keyring_logger.hpp"
#include "keyring/foundation/keyring_metrics.hpp"
#include "keyring/foundation/keyring_result.hpp"

#include "keyring/keys/key_material_generator.hpp"
#include "keyring/keys/key_store.hpp"
#include "keyring/keys/key_types.hpp"
#include "keyring/keys/secret_store.hpp"

#include "keyring/rotation/rotation_config.hpp"
#include "keyring/rotation/rotation_controller.hpp"
#include "keyring/rotation/rotation_events.hpp"

#include "keyring/token/claims.hpp"
#include "keyring/token/jwks_exporter.hpp"
#include "keyring/token/token_issuer.hpp"
#include "keyring/token/token_validator.hpp"

#include "keyring/service/keyring_service.hpp"
