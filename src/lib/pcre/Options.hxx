// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct RegexOptions {
	bool anchored = false;
	bool caseless = false;
	bool capture = false;

	/**
	 * Shall '.' match newline characters?
	 */
	bool dotall = true;
};
