// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct AuthConfig;

/**
 * Decide whether a running sidecar needs to be restarted because
 * its #AuthConfig has changed.
 *
 * Only the fields relevant to the (new) mode are compared: in OAuth
 * mode all "oauth_*" fields plus "host" and "port", in API key mode
 * only "api_key".  An empty value is equal to an absent one.
 *
 * @param old_config the configuration of the running sidecar
 * (nullptr if none)
 * @param new_config the requested configuration (nullptr if none)
 */
[[gnu::pure]]
bool
HasAuthConfigChanged(const AuthConfig *old_config,
		     const AuthConfig *new_config) noexcept;
