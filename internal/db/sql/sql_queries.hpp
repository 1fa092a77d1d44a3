#pragma once

namespace valuegraph::db::sql {

/*
  Generation-2 data access SQL.

  Payload columns always appear in declaration order
  (bool, u8, i8, u16, i16, u32, i32, u64, i64, f32, f64, str),
  which is also model::Value's alternative order.
*/

static constexpr int kPayloadColumnCount = 12;

static constexpr const char* UPSERT_VALUE =
    "INSERT INTO `values`(uuid,bool,u8,i8,u16,i16,u32,i32,u64,i64,f32,f64,str)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(uuid) DO UPDATE SET"
    " bool=excluded.bool,u8=excluded.u8,i8=excluded.i8,u16=excluded.u16,i16=excluded.i16,"
    "u32=excluded.u32,i32=excluded.i32,u64=excluded.u64,i64=excluded.i64,"
    "f32=excluded.f32,f64=excluded.f64,str=excluded.str;";

static constexpr const char* INSERT_VALUE =
    "INSERT INTO `values`(uuid,bool,u8,i8,u16,i16,u32,i32,u64,i64,f32,f64,str)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_VALUE =
    "SELECT uuid,bool,u8,i8,u16,i16,u32,i32,u64,i64,f32,f64,str"
    " FROM `values` WHERE uuid=?;";

static constexpr const char* DELETE_VALUE = "DELETE FROM `values` WHERE uuid=?;";

static constexpr const char* SELECT_VALUES_BY_STR = "SELECT uuid FROM `values` WHERE str=? ORDER BY rowid;";

static constexpr const char* COUNT_VALUES = "SELECT COUNT(*) FROM `values`;";

static constexpr const char* INSERT_LINK = "INSERT INTO `links`(source_uuid,key_uuid,target_uuid) VALUES(?,?,?);";

static constexpr const char* DELETE_LINK = "DELETE FROM `links` WHERE rowid=?;";

// Traversals are keyset paged: the last bound parameter is the handle to
// resume after.
static constexpr const char* SELECT_LINKS_FROM =
    "SELECT rowid,source_uuid,key_uuid,target_uuid FROM `links`"
    " WHERE source_uuid=? AND rowid>? ORDER BY rowid;";

static constexpr const char* SELECT_LINKS_FROM_WITH_KEY =
    "SELECT rowid,source_uuid,key_uuid,target_uuid FROM `links`"
    " WHERE source_uuid=? AND key_uuid=? AND rowid>? ORDER BY rowid;";

static constexpr const char* SELECT_LINKS_BY_KEY =
    "SELECT rowid,source_uuid,key_uuid,target_uuid FROM `links`"
    " WHERE key_uuid=? AND rowid>? ORDER BY rowid;";

static constexpr const char* SELECT_LINKS_TO =
    "SELECT rowid,source_uuid,key_uuid,target_uuid FROM `links`"
    " WHERE target_uuid=? AND rowid>? ORDER BY rowid;";

static constexpr const char* COUNT_LINKS = "SELECT COUNT(*) FROM `links`;";

} // namespace valuegraph::db::sql
