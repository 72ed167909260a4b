/**
 * @file gmsm.h
 * @brief Umbrella header for the gmsm library
 *
 * @author gmsm contributors
 * @copyright Copyright (c) 2026 gmsm contributors. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GMSM_GMSM_H
#define GMSM_GMSM_H

#include "gmsm/version.h"
#include "gmsm/core/common.h"
#include "gmsm/core/security.h"
#include "gmsm/utils/encoding.h"
#include "gmsm/crypto/sm/sm3.h"
#include "gmsm/crypto/sm/sm2.h"

#ifdef __cplusplus
#include "gmsm/core/errors.h"
#include "gmsm/core/types.h"
#include "gmsm/math/field_element.h"
#include "gmsm/crypto/digest.h"
#include "gmsm/crypto/random.h"
#include "gmsm/crypto/signature_encoding.h"
#include "gmsm/crypto/ecc/ec_curve.h"
#include "gmsm/crypto/ecc/ec_multiplier.h"
#include "gmsm/crypto/ecc/ec_params.h"
#include "gmsm/crypto/sm/sm2_util.h"
#include "gmsm/crypto/sm/sm2_signer.h"
#include "gmsm/crypto/sm/sm2_engine.h"
#include "gmsm/crypto/sm/sm2_key_exchange.h"
#endif

#endif // GMSM_GMSM_H
