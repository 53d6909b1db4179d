// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "weather_codes.hxx"

#include <cstring>
#include <vector>

#include <boost/algorithm/string/join.hpp>

namespace aerowx {

const Token weather_phenomena[] = {
    { "DZ", "морось" },
    { "RA", "дождь" },
    { "SN", "снег" },
    { "SG", "снежные зёрна" },
    { "IC", "ледяные кристаллы" },
    { "PL", "ледяной дождь" },
    { "GR", "град" },
    { "GS", "мелкий град/ледяная крупа" },
    { "UP", "неизвестные осадки" },
    { "BR", "дымка" },
    { "FG", "туман" },
    { "FU", "дым" },
    { "VA", "вулканический пепел" },
    { "DU", "пыль" },
    { "SA", "песок" },
    { "HZ", "мгла" },
    { "PY", "брызги" },
    { "SQ", "шквалы" },
    { "FC", "смерч/воронка" },
    { "SS", "песчаная буря" },
    { "DS", "пыльная буря" },
    { 0, 0 }
};

// whole-group wording; the SH entries replace the shower descriptor
const Token weather_compounds[] = {
    { "SNRA", "снег с дождём" },
    { "RASN", "дождь со снегом" },
    { "SNPL", "снег с ледяным дождём" },
    { "DZRA", "морось с дождём" },
    { "RADZ", "дождь с моросью" },
    { "SNDZ", "снег с моросью" },
    { "SHSN", "ливневой снег" },
    { "SHRA", "ливневой дождь" },
    { "SHGR", "ливневой град" },
    { "SHGS", "ливневая ледяная крупа" },
    { "SHPL", "ливневой ледяной дождь" },
    { "SHSNRA", "ливневой снег с дождём" },
    { "SHRASN", "ливневой дождь со снегом" },
    { 0, 0 }
};

const Token weather_descriptors[] = {
    { "MI", "местами" },
    { "PR", "частичный" },
    { "BC", "область" },
    { "DR", "низовой" },
    { "BL", "метель" },
    { "SH", "ливневой" },
    { "TS", "гроза" },
    { "FZ", "переохлаждённый" },
    { "VC", "в окрестностях" },
    { 0, 0 }
};

const Token cloud_coverage[] = {
    { "SKC", "ясно" },
    { "CLR", "ясно (авто)" },
    { "NSC", "нет значимой облачности" },
    { "NCD", "облачность не обнаружена (авто)" },
    { "FEW", "малооблачно (1-3 балла)" },
    { "SCT", "рассеянные облака (3-6 баллов)" },
    { "BKN", "разорванные облака (6-9 баллов)" },
    { "OVC", "сплошная облачность (10 баллов)" },
    { "VV", "вертикальная видимость" },
    { 0, 0 }
};

const Token cloud_qualifiers[] = {
    { "CB", "кучево-дождевые" },
    { "TCU", "мощно-кучевые" },
    { 0, 0 }
};

const Token trend_markers[] = {
    { "BECMG", "Ожидается изменение условий" },
    { "TEMPO", "Временами" },
    { "PROB30", "Вероятность 30%" },
    { "PROB40", "Вероятность 40%" },
    { "NOSIG", "Без существенных изменений" },
    { "FM", "с" },
    { "TL", "до" },
    { "AT", "в" },
    { 0, 0 }
};

const Token runway_deposits[] = {
    { "0", "чистая и сухая" },
    { "1", "влажная" },
    { "2", "мокрая или лужи" },
    { "3", "изморозь или иней" },
    { "4", "сухой снег" },
    { "5", "мокрый снег" },
    { "6", "слякоть" },
    { "7", "лёд" },
    { "8", "уплотнённый или укатанный снег" },
    { "9", "замёрзшие колеи или гребни" },
    { "/", "тип не определён" },
    { 0, 0 }
};

const Token runway_extents[] = {
    { "1", "10% или менее" },
    { "2", "11-25%" },
    { "5", "26-50%" },
    { "9", "51-100%" },
    { "/", "не определена" },
    { "NR", "не сообщается" },
    { 0, 0 }
};

const Token rvr_tendencies[] = {
    { "U", "увеличивается" },
    { "D", "уменьшается" },
    { "N", "без изменений" },
    { 0, 0 }
};

const Token wind_units[] = {
    { "KT", "узлы" },
    { "MPS", "м/с" },
    { "KMH", "км/ч" },
    { 0, 0 }
};

const Token change_group_types[] = {
    { "BECMG", "Постепенное изменение (BECMG)" },
    { "TEMPO", "Временные изменения (TEMPO)" },
    { "FM", "С определённого времени (FM)" },
    { "PROB30", "Вероятность 30% (PROB30)" },
    { "PROB40", "Вероятность 40% (PROB40)" },
    { "PROB30 TEMPO", "Вероятность 30% (PROB30 TEMPO)" },
    { "PROB40 TEMPO", "Вероятность 40% (PROB40 TEMPO)" },
    { 0, 0 }
};

namespace {

const Token instrumental_forms[] = {
    { "дождь", "дождём" },
    { "снег", "снегом" },
    { "морось", "моросью" },
    { "град", "градом" },
    { "туман", "туманом" },
    { "дымка", "дымкой" },
    { "дым", "дымом" },
    { "мгла", "мглой" },
    { "пыль", "пылью" },
    { "песок", "песком" },
    { "ледяной дождь", "ледяным дождём" },
    { "снежные зёрна", "снежными зёрнами" },
    { "ледяные кристаллы", "ледяными кристаллами" },
    { "крупа", "крупой" },
    { "ледяной", "ледяным" },
    { "ледяная", "ледяной" },
    { "ливневой", "ливневым" },
    { "ливневая", "ливневой" },
    { 0, 0 }
};

// "со" before a word starting with с and a consonant ("со снегом")
std::string withConnector(const std::string& instrumental)
{
    static const char* vowels[] = { "а", "е", "ё", "и", "о", "у", "ы", "э", "ю", "я" };
    const std::string s = "с";
    if (instrumental.compare(0, s.size(), s) == 0 && instrumental.size() > s.size()) {
        for (const char* v : vowels) {
            if (instrumental.compare(s.size(), strlen(v), v) == 0)
                return "с " + instrumental;
        }
        return "со " + instrumental;
    }
    return "с " + instrumental;
}

std::string composePhenomena(const WeatherPhenomenon& w, bool* showerBaked)
{
    *showerBaked = false;
    const std::string phen = w.phenomenon();

    if (w.hasDescriptor("SH")) {
        if (const Token* t = findToken(weather_compounds, "SH" + phen)) {
            *showerBaked = true;
            return t->text;
        }
    }
    if (const Token* t = findToken(weather_compounds, phen))
        return t->text;
    if (const Token* t = findToken(weather_phenomena, phen))
        return t->text;

    std::vector<std::string> parts;
    for (const auto& code : w.phenomena) {
        const Token* t = findToken(weather_phenomena, code);
        if (!t)
            continue;
        parts.push_back(parts.empty() ? std::string{t->text}
                                      : withConnector(instrumentalCase(t->text)));
    }
    if (parts.empty())
        return phen;
    return boost::algorithm::join(parts, " ");
}

} // of anonymous namespace

std::string translateCode(const Token* list, const std::string& id)
{
    const Token* t = findToken(list, id);
    return t ? t->text : id;
}

std::string instrumentalCase(const std::string& term)
{
    if (const Token* t = findToken(instrumental_forms, term))
        return t->text;

    // leading words with a known form ("ливневой дождь"), the rest as is
    std::string result;
    std::string::size_type pos = 0;
    while (pos < term.size()) {
        std::string::size_type sp = term.find(' ', pos);
        const std::string word = term.substr(pos, sp == std::string::npos ? sp : sp - pos);
        const Token* t = findToken(instrumental_forms, word);
        if (!t)
            break;
        result += t->text;
        if (sp == std::string::npos)
            return result;
        result += ' ';
        pos = sp + 1;
    }
    return result + term.substr(pos);
}

std::string describeWeather(const WeatherPhenomenon& w)
{
    bool showerBaked = false;
    const std::string base = w.phenomena.empty() ? std::string{}
                                                 : composePhenomena(w, &showerBaked);

    std::vector<std::string> words;
    for (const auto& d : w.descriptors) {
        if (d == "TS" || (d == "SH" && showerBaked))
            continue;
        words.push_back(translateCode(weather_descriptors, d));
    }

    if (w.hasDescriptor("TS")) {
        std::string storm = "гроза";
        if (w.intensity == '+')
            storm = "сильная гроза";
        else if (w.intensity == '-')
            storm = "слабая гроза";
        if (!base.empty())
            storm += " " + withConnector(instrumentalCase(base));
        words.push_back(storm);
        return boost::algorithm::join(words, " ");
    }

    if (base.empty()) {
        // shower descriptor alone
        if (words.size() == 1 && w.descriptors.back() == "SH")
            words.back() = "ливень";
        else if (!words.empty() && w.descriptors.back() == "SH")
            words.back() = "ливни";
    } else {
        words.push_back(base);
    }

    if (w.intensity == '+')
        words.insert(words.begin(), "сильный");
    else if (w.intensity == '-')
        words.insert(words.begin(), "слабый");

    return boost::algorithm::join(words, " ");
}

} // namespace aerowx
