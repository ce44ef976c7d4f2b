#include "engine/EngineConfig.h"

namespace instflow {
namespace engine {

// Built-in tables. config.json overrides every one of them; these only keep
// a bare install working.

CalendarConfig::CalendarConfig() {
    holidays[2025] = {
        "2025-01-26", "2025-02-26", "2025-03-14", "2025-03-31",
        "2025-04-10", "2025-04-14", "2025-04-18", "2025-05-01",
        "2025-08-15", "2025-08-27", "2025-10-02",
        "2025-10-21", "2025-10-22", "2025-11-05", "2025-12-25",
    };
    holidays[2026] = {
        "2026-01-26", "2026-03-19", "2026-03-20", "2026-04-02",
        "2026-04-03", "2026-04-14", "2026-04-17", "2026-05-01",
        "2026-06-19", "2026-08-15", "2026-08-31", "2026-10-09",
        "2026-10-28", "2026-11-25", "2026-12-25",
    };
}

ClassifierConfig::ClassifierConfig()
    : fii_keywords{
        // generic
        "FII", "FPI", "FOREIGN", "OVERSEAS", "GLOBAL", "INTERNATIONAL", "NON RESIDENT",
        // foreign banks, brokers and fund houses
        "MORGAN STANLEY", "GOLDMAN SACHS", "CITIGROUP", "CITI BANK", "CITIBANK",
        "BLACKROCK", "VANGUARD", "FIDELITY", "NOMURA", "MACQUARIE", "MORGANSTANLEY",
        "UBS", "BARCLAYS", "HSBC", "JPMORGAN", "JP MORGAN", "DEUTSCHE", "DB INTERNATIONAL",
        "MERRILL LYNCH", "SOCIETE GENERALE", "BNP PARIBAS", "LAZARD", "NATIXIS",
        "WARBURG", "WELLINGTON", "ABERDEEN", "SCHRODERS", "ASHMORE", "INVESCO",
        "EASTSPRING", "MATTHEWS ASIA", "DIMENSIONAL", "NEUBERGER", "PICTET",
        "CREDIT SUISSE", "CLSA", "JEFFERIES", "BOFA", "BANK OF AMERICA", "CITI GROUP",
        "MOTILAL OSWAL FOREIGN", "MIRAE ASSET GLOBAL", "AMUNDI", "FRANKLIN OVERSEAS",
        "FIRST STATE", "OPPENHEIMER", "ARTISAN", "DRIEHAUS", "CAUSEWAY", "COMMONWEALTH",
        "DODGE & COX", "HARBOR", "WASATCH", "WILLIAM BLAIR", "MANNING", "THORNBURG",
        "GENESIS", "CORONATION", "ALLAN GRAY", "AFRICA", "EMERGING MARKETS",
        // offshore domiciles
        "SINGAPORE", "CAYMAN", "MAURITIUS", "CYPRUS", "NETHERLANDS ANTILLES",
    }
    , dii_keywords{
        // mutual funds
        "MUTUAL FUND", "TRUSTEE", "AMC LIMITED", "ASSET MANAGEMENT",
        " MF ", "MF-", "- MF", "(MF)", "_MF_",
        "SBI MF", "SBI MUTUAL", "SBI BLUECHIP", "SBI MAGNUM",
        "HDFC MF", "HDFC MUTUAL", "HDFC BALANCED", "HDFC EQUITY",
        "ICICI PRUDENTIAL MF", "ICICI PRU MF", "ICICI PRUDENTIAL MUTUAL",
        "KOTAK MAHINDRA MF", "KOTAK MF", "KOTAK MUTUAL",
        "AXIS MUTUAL", "AXIS MF", "AXIS LONG TERM",
        "NIPPON INDIA MF", "NIPPON MF", "NIPPON MUTUAL", "NIPPON INDIA MUTUAL",
        "ADITYA BIRLA SUN LIFE", "ABSL MF", "ADITYA BIRLA MF",
        "DSP MUTUAL", "DSP MF", "DSP BLACKROCK",
        "FRANKLIN TEMPLETON", "FRANKLIN INDIA",
        "TATA MUTUAL", "TATA MF", "TATA AIA",
        "MIRAE ASSET MF", "MIRAE ASSET MUTUAL",
        "EDELWEISS MF", "EDELWEISS MUTUAL",
        "MOTILAL OSWAL MF", "MOTILAL OSWAL MUTUAL",
        "SUNDARAM MF", "SUNDARAM MUTUAL",
        "UTI MUTUAL", "UTI MF", "UTI TRUSTEE",
        "CANARA ROBECO", "PGIM INDIA MF", "PGIM INDIA MUTUAL",
        "WHITEOAK CAPITAL MF", "WHITEOAK MF",
        "QUANT MUTUAL", "QUANT MF",
        "BANDHAN MF", "BANDHAN MUTUAL",
        "NAVI MF", "NAVI MUTUAL", "360 ONE MF", "360ONE MF",
        "GROWW MF", "GROWW MUTUAL",
        "SAMCO MF", "SAMCO MUTUAL", "TRUST MF", "TRUST MUTUAL",
        // insurers
        "LIC OF INDIA", "LIC MF", "LIFE INSURANCE CORPORATION",
        "SBI LIFE", "HDFC LIFE", "ICICI PRUDENTIAL LIFE", "MAX LIFE", "BAJAJ LIFE",
        "INSURANCE", "LIFE INSURANCE", "GENERAL INSURANCE", "REINSURANCE",
        "NEW INDIA ASSURANCE", "ORIENTAL INSURANCE", "NATIONAL INSURANCE CO",
        "BAJAJ ALLIANZ", "HDFC ERGO", "ICICI LOMBARD", "STAR HEALTH", "CARE HEALTH",
        "GIC RE", "GIC OF INDIA", "UNITED INDIA", "AGRICULTURE INSURANCE",
        // provident / pension
        "PROVIDENT FUND", "PENSION FUND", "NATIONAL PENSION", "NPS TRUST",
        "EMPLOYEES PROVIDENT", "EPFO", "COAL MINES", "SEAMEN PROVIDENT",
        // sovereign / government
        "NATIONAL INVESTMENT AND INFRASTRUCTURE", "NIIF",
        "INDIA INFRASTRUCTURE FINANCE", "IIFCL",
        "POWER FINANCE", "PFC", "REC LIMITED", "REC LTD",
        "NABARD", "SIDBI", "EXIM BANK", "NATIONAL HOUSING BANK",
        // AIF / PMS
        "ALTERNATIVE INVESTMENT FUND", "AIF", "CAT III AIF", "CAT II AIF",
        "PORTFOLIO MANAGEMENT", "PMS ",
    }
{}

DealSourceConfig::DealSourceConfig()
    : fallback_stocks{
        {"GMRAIRPORT", "GMR Airports",       CashAction::BUY,  CashAction::BUY},
        {"TORNTPHARM", "Torrent Pharma",     CashAction::BUY,  CashAction::BUY},
        {"POWERGRID",  "Power Grid Corp",    CashAction::BUY,  CashAction::BUY},
        {"JSWENERGY",  "JSW Energy",         CashAction::BUY,  CashAction::BUY},
        {"SUPREMEIND", "Supreme Industries", CashAction::BUY,  CashAction::SELL},
        {"ASTRAL",     "Astral Poly",        CashAction::BUY,  CashAction::BUY},
        {"INDIGO",     "IndiGo",             CashAction::BUY,  CashAction::BUY},
        {"BSE",        "BSE Limited",        CashAction::SELL, CashAction::SELL},
        {"GODREJCP",   "Godrej Consumer",    CashAction::BUY,  CashAction::BUY},
        {"SBICARD",    "SBI Cards",          CashAction::BUY,  CashAction::BUY},
        {"CAMS",       "CAMS",               CashAction::BUY,  CashAction::BUY},
        {"BRITANNIA",  "Britannia",          CashAction::BUY,  CashAction::BUY},
        {"KFINTECH",   "KFin Technologies",  CashAction::BUY,  CashAction::SELL},
        {"ANGELONE",   "Angel One",          CashAction::SELL, CashAction::BUY},
        {"POLICYBZR",  "PB Fintech",         CashAction::BUY,  CashAction::BUY},
        {"NUVAMA",     "Nuvama Wealth",      CashAction::BUY,  CashAction::SELL},
        {"FORTIS",     "Fortis Healthcare",  CashAction::BUY,  CashAction::BUY},
        {"MANAPPURAM", "Manappuram Finance", CashAction::BUY,  CashAction::SELL},
        {"360ONE",     "360 One WAM",        CashAction::BUY,  CashAction::BUY},
        {"APLAPOLLO",  "APL Apollo Tubes",   CashAction::BUY,  CashAction::BUY},
    }
{}

} // namespace engine
} // namespace instflow
