#include "sqlite_schema.hpp"

namespace valuegraph::db::sqlite {

sql::MigrationStep Generation1Step() {
  sql::MigrationStep step;
  step.from = 0;
  step.to   = 1;
  step.name = "text identifiers";

  step.structure = {
      "CREATE TABLE IF NOT EXISTS `values` ("
      " `id` TEXT NOT NULL,"
      " `bool` BOOLEAN,"
      " `u8` UNSIGNED INT(1),"
      " `i8` INT(1),"
      " `u16` UNSIGNED INT(2),"
      " `i16` INT(2),"
      " `u32` UNSIGNED INT(4),"
      " `i32` INT(4),"
      " `u64` UNSIGNED INT(8),"
      " `i64` INT(8),"
      " `f32` FLOAT(4),"
      " `f64` FLOAT(8),"
      " `str` TEXT,"
      " PRIMARY KEY (`id`));",
      "CREATE TABLE IF NOT EXISTS `links` ("
      " `source_id` TEXT NOT NULL,"
      " `key_id` TEXT,"
      " `target_id` TEXT NOT NULL);",
  };

  step.build_indexes = {
      "CREATE UNIQUE INDEX IF NOT EXISTS `data_id` ON `values` (`id`);",
      "CREATE INDEX IF NOT EXISTS `links_source_id` ON `links` (`source_id`);",
      "CREATE INDEX IF NOT EXISTS `links_key_id` ON `links` (`key_id`);",
      "CREATE INDEX IF NOT EXISTS `links_keyed` ON `links` (`source_id`, `key_id`);",
  };

  return step;
}

sql::MigrationStep Generation2Step() {
  sql::MigrationStep step;
  step.from        = 1;
  step.to          = 2;
  step.name        = "binary identifiers";
  step.destructive = true;

  step.drop_indexes = {
      "DROP INDEX IF EXISTS `data_id`;",
      "DROP INDEX IF EXISTS `links_source_id`;",
      "DROP INDEX IF EXISTS `links_key_id`;",
      "DROP INDEX IF EXISTS `links_keyed`;",
  };

  step.structure = {
      "DROP TABLE IF EXISTS `values_next`;",
      "CREATE TABLE `values_next` ("
      " `uuid` BLOB NOT NULL UNIQUE CHECK(length(`uuid`) = 16),"
      " `bool` BOOLEAN,"
      " `u8` UNSIGNED INT(1),"
      " `i8` INT(1),"
      " `u16` UNSIGNED INT(2),"
      " `i16` INT(2),"
      " `u32` UNSIGNED INT(4),"
      " `i32` INT(4),"
      " `u64` UNSIGNED INT(8),"
      " `i64` INT(8),"
      " `f32` FLOAT(4),"
      " `f64` FLOAT(8),"
      " `str` TEXT,"
      " PRIMARY KEY (`uuid`));",
      "DROP TABLE IF EXISTS `links_next`;",
      "CREATE TABLE `links_next` ("
      " `source_uuid` BLOB NOT NULL CHECK(length(`source_uuid`) = 16),"
      " `key_uuid` BLOB CHECK(length(`key_uuid`) = 16),"
      " `target_uuid` BLOB NOT NULL CHECK(length(`target_uuid`) = 16));",
  };

  step.copy = {
      "INSERT INTO `values_next` (`uuid`, `bool`, `u8`, `i8`, `u16`, `i16`, `u32`, `i32`, `u64`, `i64`, `f32`, `f64`, `str`)"
      " SELECT vg_legacy_uuid(`id`), `bool`, `u8`, `i8`, `u16`, `i16`, `u32`, `i32`, `u64`, `i64`, `f32`, `f64`, `str`"
      " FROM `values` ORDER BY rowid;",
      "INSERT INTO `links_next` (`source_uuid`, `key_uuid`, `target_uuid`)"
      " SELECT vg_legacy_uuid(`source_id`), vg_legacy_uuid(`key_id`), vg_legacy_uuid(`target_id`)"
      " FROM `links` ORDER BY rowid;",
  };

  step.verify = {
      {"values", "SELECT COUNT(*) FROM `values`;", "SELECT COUNT(*) FROM `values_next`;"},
      {"links", "SELECT COUNT(*) FROM `links`;", "SELECT COUNT(*) FROM `links_next`;"},
  };

  step.swap = {
      "DROP TABLE `values`;",
      "ALTER TABLE `values_next` RENAME TO `values`;",
      "DROP TABLE `links`;",
      "ALTER TABLE `links_next` RENAME TO `links`;",
  };

  step.build_indexes = {
      "CREATE UNIQUE INDEX `data_id` ON `values` (`uuid`);",
      "CREATE INDEX `data_strs` ON `values` (`str`);",
      "CREATE INDEX `links_source` ON `links` (`source_uuid`);",
      "CREATE INDEX `links_key` ON `links` (`key_uuid`);",
      "CREATE INDEX `links_target` ON `links` (`target_uuid`);",
      "CREATE INDEX `links_keyed` ON `links` (`source_uuid`, `key_uuid`);",
  };

  step.integrity = {
      {"malformed_endpoints",
       "SELECT COUNT(*) FROM `links` WHERE typeof(`source_uuid`) != 'blob' OR length(`source_uuid`) != 16"
       " OR (`key_uuid` IS NOT NULL AND (typeof(`key_uuid`) != 'blob' OR length(`key_uuid`) != 16))"
       " OR typeof(`target_uuid`) != 'blob' OR length(`target_uuid`) != 16;"},
      {"dangling_source",
       "SELECT COUNT(*) FROM `links` AS l"
       " WHERE NOT EXISTS (SELECT 1 FROM `values` AS v WHERE v.`uuid` = l.`source_uuid`);"},
      {"dangling_key",
       "SELECT COUNT(*) FROM `links` AS l WHERE l.`key_uuid` IS NOT NULL"
       " AND NOT EXISTS (SELECT 1 FROM `values` AS v WHERE v.`uuid` = l.`key_uuid`);"},
      {"dangling_target",
       "SELECT COUNT(*) FROM `links` AS l"
       " WHERE NOT EXISTS (SELECT 1 FROM `values` AS v WHERE v.`uuid` = l.`target_uuid`);"},
  };

  return step;
}

std::vector<sql::MigrationStep> MigrationSteps() {
  return {Generation1Step(), Generation2Step()};
}

} // namespace valuegraph::db::sqlite
