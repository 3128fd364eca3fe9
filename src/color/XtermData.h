#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

// 16-color defaults: X(code, name, value).
// The values are what a typical terminal shows; actual output is up to the terminal.
#define XFOREACH_XTERM16_COLOR(X) \
    X(0, "black", 0x000000) \
    X(1, "red", 0x800000) \
    X(2, "green", 0x008000) \
    X(3, "yellow", 0x808000) \
    X(4, "blue", 0x000080) \
    X(5, "magenta", 0x800080) \
    X(6, "cyan", 0x008080) \
    X(7, "white", 0xc0c0c0) \
    X(8, "gray", 0x808080) \
    X(9, "hi-red", 0xff0000) \
    X(10, "hi-green", 0x00ff00) \
    X(11, "hi-yellow", 0xffff00) \
    X(12, "hi-blue", 0x0000ff) \
    X(13, "hi-magenta", 0xff00ff) \
    X(14, "hi-cyan", 0x00ffff) \
    X(15, "hi-white", 0xffffff)

// xterm-256 names by code: X(code, name).
// Values are computed from the code; see Color256::toRgb().
#define XFOREACH_XTERM256_NAME(X) \
    X(0, "black") \
    X(1, "maroon") \
    X(2, "green") \
    X(3, "olive") \
    X(4, "navy") \
    X(5, "purple-5") \
    X(6, "teal") \
    X(7, "silver") \
    X(8, "grey") \
    X(9, "red") \
    X(10, "lime") \
    X(11, "yellow") \
    X(12, "blue") \
    X(13, "fuchsia") \
    X(14, "aqua") \
    X(15, "white") \
    X(16, "grey-0") \
    X(17, "navy-blue") \
    X(18, "dark-blue") \
    X(19, "blue-3") \
    X(20, "blue-2") \
    X(21, "blue-1") \
    X(22, "dark-green") \
    X(23, "deep-sky-blue-7") \
    X(24, "deep-sky-blue-6") \
    X(25, "deep-sky-blue-5") \
    X(26, "dodger-blue-3") \
    X(27, "dodger-blue-2") \
    X(28, "green-5") \
    X(29, "spring-green-4") \
    X(30, "turquoise-4") \
    X(31, "deep-sky-blue-4") \
    X(32, "deep-sky-blue-3") \
    X(33, "dodger-blue-1") \
    X(34, "green-4") \
    X(35, "spring-green-5") \
    X(36, "dark-cyan") \
    X(37, "light-sea-green") \
    X(38, "deep-sky-blue-2") \
    X(39, "deep-sky-blue-1") \
    X(40, "green-3") \
    X(41, "spring-green-3") \
    X(42, "spring-green-6") \
    X(43, "cyan-3") \
    X(44, "dark-turquoise") \
    X(45, "turquoise-2") \
    X(46, "green-2") \
    X(47, "spring-green-2") \
    X(48, "spring-green-1") \
    X(49, "medium-spring-green") \
    X(50, "cyan-2") \
    X(51, "cyan-1") \
    X(52, "dark-red-2") \
    X(53, "deep-pink-8") \
    X(54, "purple-6") \
    X(55, "purple-4") \
    X(56, "purple-3") \
    X(57, "blue-violet") \
    X(58, "orange-4") \
    X(59, "grey-37") \
    X(60, "medium-purple-7") \
    X(61, "slate-blue-3") \
    X(62, "slate-blue-2") \
    X(63, "royal-blue-1") \
    X(64, "chartreuse-6") \
    X(65, "dark-sea-green-9") \
    X(66, "pale-turquoise-4") \
    X(67, "steel-blue") \
    X(68, "steel-blue-3") \
    X(69, "cornflower-blue") \
    X(70, "chartreuse-5") \
    X(71, "dark-sea-green-8") \
    X(72, "cadet-blue-2") \
    X(73, "cadet-blue") \
    X(74, "sky-blue-3") \
    X(75, "steel-blue-2") \
    X(76, "chartreuse-4") \
    X(77, "pale-green-4") \
    X(78, "sea-green-3") \
    X(79, "aquamarine-3") \
    X(80, "medium-turquoise") \
    X(81, "steel-blue-1") \
    X(82, "chartreuse-2") \
    X(83, "sea-green-4") \
    X(84, "sea-green-2") \
    X(85, "sea-green-1") \
    X(86, "aquamarine-2") \
    X(87, "dark-slate-gray-2") \
    X(88, "dark-red") \
    X(89, "deep-pink-7") \
    X(90, "dark-magenta-2") \
    X(91, "dark-magenta") \
    X(92, "dark-violet-2") \
    X(93, "purple-2") \
    X(94, "orange-3") \
    X(95, "light-pink-3") \
    X(96, "plum-4") \
    X(97, "medium-purple-6") \
    X(98, "medium-purple-5") \
    X(99, "slate-blue-1") \
    X(100, "yellow-6") \
    X(101, "wheat-4") \
    X(102, "grey-53") \
    X(103, "light-slate-grey") \
    X(104, "medium-purple-4") \
    X(105, "light-slate-blue") \
    X(106, "yellow-4") \
    X(107, "dark-olive-green-6") \
    X(108, "dark-sea-green-7") \
    X(109, "light-sky-blue-3") \
    X(110, "light-sky-blue-2") \
    X(111, "sky-blue-2") \
    X(112, "chartreuse-3") \
    X(113, "dark-olive-green-4") \
    X(114, "pale-green-3") \
    X(115, "dark-sea-green-5") \
    X(116, "dark-slate-gray-3") \
    X(117, "sky-blue-1") \
    X(118, "chartreuse-1") \
    X(119, "light-green-2") \
    X(120, "light-green") \
    X(121, "pale-green-1") \
    X(122, "aquamarine-1") \
    X(123, "dark-slate-gray-1") \
    X(124, "red-4") \
    X(125, "deep-pink-6") \
    X(126, "medium-violet-red") \
    X(127, "magenta-6") \
    X(128, "dark-violet") \
    X(129, "purple") \
    X(130, "dark-orange-3") \
    X(131, "indian-red-4") \
    X(132, "hot-pink-5") \
    X(133, "medium-orchid-4") \
    X(134, "medium-orchid-3") \
    X(135, "medium-purple-2") \
    X(136, "dark-goldenrod") \
    X(137, "light-salmon-3") \
    X(138, "rosy-brown") \
    X(139, "grey-63") \
    X(140, "medium-purple-3") \
    X(141, "medium-purple-1") \
    X(142, "gold-3") \
    X(143, "dark-khaki") \
    X(144, "navajo-white-3") \
    X(145, "grey-69") \
    X(146, "light-steel-blue-3") \
    X(147, "light-steel-blue-2") \
    X(148, "yellow-5") \
    X(149, "dark-olive-green-5") \
    X(150, "dark-sea-green-6") \
    X(151, "dark-sea-green-4") \
    X(152, "light-cyan-3") \
    X(153, "light-sky-blue-1") \
    X(154, "green-yellow") \
    X(155, "dark-olive-green-3") \
    X(156, "pale-green-2") \
    X(157, "dark-sea-green-3") \
    X(158, "dark-sea-green-1") \
    X(159, "pale-turquoise-1") \
    X(160, "red-3") \
    X(161, "deep-pink-5") \
    X(162, "deep-pink-3") \
    X(163, "magenta-3") \
    X(164, "magenta-5") \
    X(165, "magenta-4") \
    X(166, "dark-orange-2") \
    X(167, "indian-red-3") \
    X(168, "hot-pink-4") \
    X(169, "hot-pink-3") \
    X(170, "orchid-3") \
    X(171, "medium-orchid-2") \
    X(172, "orange-2") \
    X(173, "light-salmon-2") \
    X(174, "light-pink-2") \
    X(175, "pink-3") \
    X(176, "plum-3") \
    X(177, "violet") \
    X(178, "gold-2") \
    X(179, "light-goldenrod-5") \
    X(180, "tan") \
    X(181, "misty-rose-3") \
    X(182, "thistle-3") \
    X(183, "plum-2") \
    X(184, "yellow-3") \
    X(185, "khaki-3") \
    X(186, "light-goldenrod-3") \
    X(187, "light-yellow-3") \
    X(188, "grey-84") \
    X(189, "light-steel-blue-1") \
    X(190, "yellow-2") \
    X(191, "dark-olive-green-2") \
    X(192, "dark-olive-green-1") \
    X(193, "dark-sea-green-2") \
    X(194, "honeydew-2") \
    X(195, "light-cyan-1") \
    X(196, "red-1") \
    X(197, "deep-pink-4") \
    X(198, "deep-pink-2") \
    X(199, "deep-pink-1") \
    X(200, "magenta-2") \
    X(201, "magenta-1") \
    X(202, "orange-red-1") \
    X(203, "indian-red-1") \
    X(204, "indian-red-2") \
    X(205, "hot-pink-2") \
    X(206, "hot-pink") \
    X(207, "medium-orchid-1") \
    X(208, "dark-orange") \
    X(209, "salmon-1") \
    X(210, "light-coral") \
    X(211, "pale-violet-red-1") \
    X(212, "orchid-2") \
    X(213, "orchid-1") \
    X(214, "orange-1") \
    X(215, "sandy-brown") \
    X(216, "light-salmon-1") \
    X(217, "light-pink-1") \
    X(218, "pink-1") \
    X(219, "plum-1") \
    X(220, "gold-1") \
    X(221, "light-goldenrod-4") \
    X(222, "light-goldenrod-2") \
    X(223, "navajo-white-1") \
    X(224, "misty-rose-1") \
    X(225, "thistle-1") \
    X(226, "yellow-1") \
    X(227, "light-goldenrod-1") \
    X(228, "khaki-1") \
    X(229, "wheat-1") \
    X(230, "cornsilk-1") \
    X(231, "grey-100") \
    X(232, "grey-3") \
    X(233, "grey-7") \
    X(234, "grey-11") \
    X(235, "grey-15") \
    X(236, "grey-19") \
    X(237, "grey-23") \
    X(238, "grey-27") \
    X(239, "grey-30") \
    X(240, "grey-35") \
    X(241, "grey-39") \
    X(242, "grey-42") \
    X(243, "grey-46") \
    X(244, "grey-50") \
    X(245, "grey-54") \
    X(246, "grey-58") \
    X(247, "grey-62") \
    X(248, "grey-66") \
    X(249, "grey-70") \
    X(250, "grey-74") \
    X(251, "grey-78") \
    X(252, "grey-82") \
    X(253, "grey-85") \
    X(254, "grey-89") \
    X(255, "grey-93")
