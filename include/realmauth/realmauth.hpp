#pragma once

// Main public API - include all headers
#include "realmauth/constants.hpp"
#include "realmauth/errors.hpp"
#include "realmauth/token_type.hpp"
#include "realmauth/keypair.hpp"
#include "realmauth/device_id.hpp"
#include "realmauth/claims.hpp"
#include "realmauth/token_minter.hpp"

namespace realmauth {}
