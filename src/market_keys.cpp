#include "market_keys.hpp"

namespace ee {

const char* marketKeyName(MarketKey key) {
    switch (key) {
    case MarketKey::Over15: return "over_1_5";
    case MarketKey::Over25: return "over_2_5";
    case MarketKey::Over35: return "over_3_5";
    case MarketKey::Under15: return "under_1_5";
    case MarketKey::Under25: return "under_2_5";
    case MarketKey::Under35: return "under_3_5";
    case MarketKey::Under45: return "under_4_5";
    case MarketKey::BttsYes: return "btts_yes";
    case MarketKey::BttsNo: return "btts_no";
    case MarketKey::BttsOver25: return "btts_over_2_5";
    case MarketKey::BttsOver35: return "btts_over_3_5";
    case MarketKey::BttsUnder15: return "btts_under_1_5";
    case MarketKey::BttsUnder25: return "btts_under_2_5";
    case MarketKey::HomeOver15: return "home_over_1_5";
    case MarketKey::AwayOver15: return "away_over_1_5";
    case MarketKey::HomeWin: return "home_win";
    case MarketKey::Draw: return "draw";
    case MarketKey::AwayWin: return "away_win";
    case MarketKey::DnbHome: return "dnb_home";
    case MarketKey::DnbAway: return "dnb_away";
    case MarketKey::BttsHomeWin: return "btts_home_win";
    case MarketKey::BttsAwayWin: return "btts_away_win";
    case MarketKey::FirstHalfOver05: return "1h_over_0_5";
    case MarketKey::FirstHalfOver15: return "1h_over_1_5";
    case MarketKey::FirstHalfOver25: return "1h_over_2_5";
    case MarketKey::FirstHalfUnder05: return "1h_under_0_5";
    case MarketKey::FirstHalfUnder15: return "1h_under_1_5";
    case MarketKey::Count: break;
    }
    return "unknown";
}

} // namespace ee
