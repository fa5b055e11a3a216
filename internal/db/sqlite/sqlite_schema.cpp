#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace fraudit::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  // alert status 1..3 = new, acknowledged, investigating
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS relationships (kind_1 INTEGER NOT NULL, id_1 INTEGER NOT NULL, kind_2 INTEGER NOT NULL, id_2 INTEGER NOT NULL, relation_type TEXT NOT NULL, confidence REAL NOT NULL CHECK (confidence >= 0 AND confidence <= 1), evidence TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (kind_1, id_1, kind_2, id_2, relation_type));",
      "CREATE INDEX IF NOT EXISTS relationships_second ON relationships (kind_2, id_2);",
      "CREATE INDEX IF NOT EXISTS relationships_type ON relationships (relation_type);",
      "CREATE TABLE IF NOT EXISTS alerts (id INTEGER PRIMARY KEY AUTOINCREMENT, alert_type TEXT NOT NULL, severity INTEGER NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL, entity_kind INTEGER NOT NULL, entity_id INTEGER NOT NULL, evidence TEXT NOT NULL DEFAULT '{}', status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS alerts_one_open ON alerts (alert_type, entity_kind, entity_id) WHERE status IN (1, 2, 3);",
      "CREATE TABLE IF NOT EXISTS entities (kind INTEGER NOT NULL, id INTEGER NOT NULL, display_name TEXT NOT NULL, normalized_name TEXT, normalized_address TEXT, external_id TEXT, street TEXT, city TEXT, state TEXT, zip_code TEXT, phone TEXT, agency_id INTEGER, job_title TEXT, annual_salary REAL, contribution_amount REAL, recipient TEXT, registered INTEGER, active INTEGER, PRIMARY KEY (kind, id));",
      "CREATE TABLE IF NOT EXISTS payments (id INTEGER PRIMARY KEY, vendor_id INTEGER NOT NULL, agency_id INTEGER NOT NULL, amount REAL NOT NULL, payment_date TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS payments_vendor_agency ON payments (vendor_id, agency_id);",
      "CREATE TABLE IF NOT EXISTS contracts (id INTEGER PRIMARY KEY, vendor_id INTEGER NOT NULL, agency_id INTEGER NOT NULL, contract_number TEXT NOT NULL DEFAULT '', value REAL NOT NULL, start_date TEXT NOT NULL, description TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS contracts_vendor_agency ON contracts (vendor_id, agency_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT kind_1,id_1,kind_2,id_2,relation_type,confidence,evidence FROM relationships LIMIT 1;");
  db.Exec("SELECT id,alert_type,severity,status FROM alerts LIMIT 1;");
  db.Exec("SELECT kind,id,display_name FROM entities LIMIT 1;");
  db.Exec("SELECT id,vendor_id,agency_id,amount,payment_date FROM payments LIMIT 1;");
  db.Exec("SELECT id,vendor_id,agency_id,value,start_date FROM contracts LIMIT 1;");
}

} // namespace fraudit::db::sqlite
