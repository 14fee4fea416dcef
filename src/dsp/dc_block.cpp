// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <turdus/dsp/dc_block.h>

void
turdus_dc_block_init(turdus_dc_block* d) {
    d->r = TURDUS_DC_BLOCK_R;
    d->x1 = 0.0;
    d->y1 = 0.0;
}
