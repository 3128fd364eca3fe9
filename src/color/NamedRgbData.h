#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

// Named RGB colors: X(name, value).
// Codes in the named palette follow table order.
// Several names may share one value (aqua and cyan); names must be unique.
#define XFOREACH_NAMED_RGB_COLOR(X) \
    X("alice-blue", 0xf0f8ff) \
    X("antique-white", 0xfaebd7) \
    X("aqua", 0x00ffff) \
    X("aquamarine", 0x7fffd4) \
    X("azure", 0xf0ffff) \
    X("beige", 0xf5f5dc) \
    X("bisque", 0xffe4c4) \
    X("black", 0x000000) \
    X("blanched-almond", 0xffebcd) \
    X("blue", 0x0000ff) \
    X("blue-violet", 0x8a2be2) \
    X("brown", 0xa52a2a) \
    X("burly-wood", 0xdeb887) \
    X("cadet-blue", 0x5f9ea0) \
    X("chartreuse", 0x7fff00) \
    X("chocolate", 0xd2691e) \
    X("coral", 0xff7f50) \
    X("cornflower-blue", 0x6495ed) \
    X("cornsilk", 0xfff8dc) \
    X("crimson", 0xdc143c) \
    X("cyan", 0x00ffff) \
    X("dark-blue", 0x00008b) \
    X("dark-cyan", 0x008b8b) \
    X("dark-goldenrod", 0xb8860b) \
    X("dark-gray", 0xa9a9a9) \
    X("dark-green", 0x006400) \
    X("dark-khaki", 0xbdb76b) \
    X("dark-magenta", 0x8b008b) \
    X("dark-olive-green", 0x556b2f) \
    X("dark-orange", 0xff8c00) \
    X("dark-orchid", 0x9932cc) \
    X("dark-red", 0x8b0000) \
    X("dark-salmon", 0xe9967a) \
    X("dark-sea-green", 0x8fbc8f) \
    X("dark-slate-blue", 0x483d8b) \
    X("dark-slate-gray", 0x2f4f4f) \
    X("dark-turquoise", 0x00ced1) \
    X("dark-violet", 0x9400d3) \
    X("deep-pink", 0xff1493) \
    X("deep-sky-blue", 0x00bfff) \
    X("dim-gray", 0x696969) \
    X("dodger-blue", 0x1e90ff) \
    X("fire-brick", 0xb22222) \
    X("floral-white", 0xfffaf0) \
    X("forest-green", 0x228b22) \
    X("fuchsia", 0xff00ff) \
    X("gainsboro", 0xdcdcdc) \
    X("ghost-white", 0xf8f8ff) \
    X("gold", 0xffd700) \
    X("goldenrod", 0xdaa520) \
    X("gray", 0x808080) \
    X("green", 0x008000) \
    X("green-yellow", 0xadff2f) \
    X("honeydew", 0xf0fff0) \
    X("hot-pink", 0xff69b4) \
    X("indian-red", 0xcd5c5c) \
    X("indigo", 0x4b0082) \
    X("ivory", 0xfffff0) \
    X("khaki", 0xf0e68c) \
    X("lavender", 0xe6e6fa) \
    X("lavender-blush", 0xfff0f5) \
    X("lawn-green", 0x7cfc00) \
    X("lemon-chiffon", 0xfffacd) \
    X("light-blue", 0xadd8e6) \
    X("light-coral", 0xf08080) \
    X("light-cyan", 0xe0ffff) \
    X("light-goldenrod-yellow", 0xfafad2) \
    X("light-gray", 0xd3d3d3) \
    X("light-green", 0x90ee90) \
    X("light-pink", 0xffb6c1) \
    X("light-salmon", 0xffa07a) \
    X("light-sea-green", 0x20b2aa) \
    X("light-sky-blue", 0x87cefa) \
    X("light-slate-gray", 0x778899) \
    X("light-steel-blue", 0xb0c4de) \
    X("light-yellow", 0xffffe0) \
    X("lime", 0x00ff00) \
    X("lime-green", 0x32cd32) \
    X("linen", 0xfaf0e6) \
    X("magenta", 0xff00ff) \
    X("maroon", 0x800000) \
    X("medium-aquamarine", 0x66cdaa) \
    X("medium-blue", 0x0000cd) \
    X("medium-orchid", 0xba55d3) \
    X("medium-purple", 0x9370db) \
    X("medium-sea-green", 0x3cb371) \
    X("medium-slate-blue", 0x7b68ee) \
    X("medium-spring-green", 0x00fa9a) \
    X("medium-turquoise", 0x48d1cc) \
    X("medium-violet-red", 0xc71585) \
    X("midnight-blue", 0x191970) \
    X("mint-cream", 0xf5fffa) \
    X("misty-rose", 0xffe4e1) \
    X("moccasin", 0xffe4b5) \
    X("navajo-white", 0xffdead) \
    X("navy", 0x000080) \
    X("old-lace", 0xfdf5e6) \
    X("olive", 0x808000) \
    X("olive-drab", 0x6b8e23) \
    X("orange", 0xffa500) \
    X("orange-red", 0xff4500) \
    X("orchid", 0xda70d6) \
    X("pale-goldenrod", 0xeee8aa) \
    X("pale-green", 0x98fb98) \
    X("pale-turquoise", 0xafeeee) \
    X("pale-violet-red", 0xdb7093) \
    X("papaya-whip", 0xffefd5) \
    X("peach-puff", 0xffdab9) \
    X("peru", 0xcd853f) \
    X("pink", 0xffc0cb) \
    X("plum", 0xdda0dd) \
    X("powder-blue", 0xb0e0e6) \
    X("purple", 0x800080) \
    X("rebecca-purple", 0x663399) \
    X("red", 0xff0000) \
    X("rosy-brown", 0xbc8f8f) \
    X("royal-blue", 0x4169e1) \
    X("saddle-brown", 0x8b4513) \
    X("salmon", 0xfa8072) \
    X("sandy-brown", 0xf4a460) \
    X("sea-green", 0x2e8b57) \
    X("seashell", 0xfff5ee) \
    X("sienna", 0xa0522d) \
    X("silver", 0xc0c0c0) \
    X("sky-blue", 0x87ceeb) \
    X("slate-blue", 0x6a5acd) \
    X("slate-gray", 0x708090) \
    X("snow", 0xfffafa) \
    X("spring-green", 0x00ff7f) \
    X("steel-blue", 0x4682b4) \
    X("tan", 0xd2b48c) \
    X("teal", 0x008080) \
    X("thistle", 0xd8bfd8) \
    X("tomato", 0xff6347) \
    X("turquoise", 0x40e0d0) \
    X("violet", 0xee82ee) \
    X("wheat", 0xf5deb3) \
    X("white", 0xffffff) \
    X("white-smoke", 0xf5f5f5) \
    X("yellow", 0xffff00) \
    X("yellow-green", 0x9acd32) \
    X("true-white", 0xffffff) \
    X("true-black", 0x000000)

// Extra names for entries above: X(alias, name).
#define XFOREACH_NAMED_RGB_ALIAS(X) \
    X("dark-grey", "dark-gray") \
    X("dark-slate-grey", "dark-slate-gray") \
    X("dim-grey", "dim-gray") \
    X("grey", "gray") \
    X("light-grey", "light-gray") \
    X("light-slate-grey", "light-slate-gray") \
    X("slate-grey", "slate-gray")
