// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "sandbox/runtime_modules.h"

namespace scriptbox::sandbox {
namespace {

constexpr absl::string_view kTextModule = R"js(
export function normalizeWhitespace(text) {
  return String(text).replace(/\s+/g, ' ').trim();
}

export function truncate(text, maxLength, suffix = '...') {
  const s = String(text);
  if (s.length <= maxLength) return s;
  return s.slice(0, Math.max(0, maxLength - suffix.length)) + suffix;
}

export function words(text) {
  return normalizeWhitespace(text).split(' ').filter((w) => w.length > 0);
}

export function slugify(text) {
  return String(text)
    .toLowerCase()
    .normalize('NFKD')
    .replace(/[\u0300-\u036f]/g, '')
    .replace(/[^a-z0-9]+/g, '-')
    .replace(/^-+|-+$/g, '');
}

export function stripHtml(html) {
  return normalizeWhitespace(String(html).replace(/<[^>]*>/g, ' '));
}
)js";

constexpr absl::string_view kCollectionsModule = R"js(
const keyOf = (key) => (typeof key === 'function' ? key : (item) => item[key]);

export function groupBy(items, key) {
  const get = keyOf(key);
  const groups = {};
  for (const item of items) {
    const k = String(get(item));
    (groups[k] ??= []).push(item);
  }
  return groups;
}

export function countBy(items, key) {
  const get = keyOf(key);
  const counts = {};
  for (const item of items) {
    const k = String(get(item));
    counts[k] = (counts[k] ?? 0) + 1;
  }
  return counts;
}

export function sortBy(items, key, direction = 'asc') {
  const get = keyOf(key);
  const sign = direction === 'desc' ? -1 : 1;
  return [...items].sort((a, b) => {
    const x = get(a);
    const y = get(b);
    return x < y ? -sign : x > y ? sign : 0;
  });
}

export function uniqueBy(items, key) {
  const get = keyOf(key);
  const seen = new Set();
  return items.filter((item) => {
    const k = get(item);
    if (seen.has(k)) return false;
    seen.add(k);
    return true;
  });
}

export function chunk(items, size) {
  const chunks = [];
  for (let i = 0; i < items.length; i += size) {
    chunks.push(items.slice(i, i + size));
  }
  return chunks;
}

export function pick(object, keys) {
  const out = {};
  for (const k of keys) {
    if (k in object) out[k] = object[k];
  }
  return out;
}
)js";

constexpr absl::string_view kMathModule = R"js(
export function sum(values) {
  return values.reduce((total, v) => total + Number(v), 0);
}

export function mean(values) {
  return values.length === 0 ? NaN : sum(values) / values.length;
}

export function percentile(values, p) {
  if (values.length === 0) return NaN;
  const sorted = values.map(Number).sort((a, b) => a - b);
  const rank = (Math.min(Math.max(p, 0), 100) / 100) * (sorted.length - 1);
  const low = Math.floor(rank);
  const high = Math.ceil(rank);
  return sorted[low] + (sorted[high] - sorted[low]) * (rank - low);
}

export function median(values) {
  return percentile(values, 50);
}

export function round(value, digits = 0) {
  const factor = 10 ** digits;
  return Math.round(Number(value) * factor) / factor;
}

export function clamp(value, low, high) {
  return Math.min(Math.max(value, low), high);
}
)js";

}  // namespace

absl::optional<absl::string_view> RuntimeModuleSource(
    absl::string_view canonical_path) {
  if (canonical_path == "std/text") return kTextModule;
  if (canonical_path == "std/collections") return kCollectionsModule;
  if (canonical_path == "std/math") return kMathModule;
  return absl::nullopt;
}

}  // namespace scriptbox::sandbox
