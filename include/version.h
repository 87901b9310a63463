/*
 * This file is part of TweakGuard.
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef TWEAKGUARD_VERSION_H
#define TWEAKGUARD_VERSION_H

#define TWEAKGUARD_VERSION_MAJOR 1
#define TWEAKGUARD_VERSION_MINOR 2
#define TWEAKGUARD_VERSION_PATCH 0

// Helper macros to turn numbers into strings
#define TWEAKGUARD_STRINGIZE2(s) #s
#define TWEAKGUARD_STRINGIZE(s) TWEAKGUARD_STRINGIZE2(s)

#define TWEAKGUARD_VERSION_STRING TWEAKGUARD_STRINGIZE(TWEAKGUARD_VERSION_MAJOR) "." \
                                  TWEAKGUARD_STRINGIZE(TWEAKGUARD_VERSION_MINOR) "." \
                                  TWEAKGUARD_STRINGIZE(TWEAKGUARD_VERSION_PATCH)
#endif // TWEAKGUARD_VERSION_H
