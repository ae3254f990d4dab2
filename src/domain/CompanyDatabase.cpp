/**
 * @file CompanyDatabase.cpp
 * @brief Curated company table and lookup helpers.
 */

#include "domain/CompanyDatabase.hpp"
#include <set>
#include <stdexcept>

namespace logoscout::domain {

namespace {

std::vector<CompanyDatabase::Record> BuiltInRecords() {
    return {
        // E-Commerce & Retail
        {"shopify", {"shopify.com", {"shopify plus"}, "E-Commerce"}},
        {"woocommerce", {"woocommerce.com", {"woo commerce", "woo"}, "E-Commerce"}},
        {"bigcommerce", {"bigcommerce.com", {"big commerce"}, "E-Commerce"}},
        {"magento", {"magento.com", {"adobe commerce"}, "E-Commerce"}},
        {"squarespace", {"squarespace.com", {"square space"}, "E-Commerce"}},
        {"wix", {"wix.com", {}, "E-Commerce"}},
        {"etsy", {"etsy.com", {}, "E-Commerce"}},
        {"amazon", {"amazon.com", {"aws marketplace"}, "E-Commerce"}},
        {"ebay", {"ebay.com", {}, "E-Commerce"}},
        {"prestashop", {"prestashop.com", {"presta shop"}, "E-Commerce"}},
        {"volusion", {"volusion.com", {}, "E-Commerce"}},
        {"flipkart", {"flipkart.com", {}, "E-Commerce"}},

        // CRM & Marketing
        {"hubspot", {"hubspot.com", {"hub spot", "hs"}, "CRM"}},
        {"salesforce", {"salesforce.com", {"sfdc", "sf"}, "CRM"}},
        {"mailchimp", {"mailchimp.com", {"mail chimp"}, "Marketing"}},
        {"marketo", {"marketo.com", {}, "Marketing"}},
        {"activecampaign", {"activecampaign.com", {"active campaign"}, "Marketing"}},
        {"constantcontact", {"constantcontact.com", {"constant contact"}, "Marketing"}},
        {"sendinblue", {"brevo.com", {"brevo"}, "Marketing"}},
        {"klaviyo", {"klaviyo.com", {}, "Marketing"}},
        {"intercom", {"intercom.com", {}, "CRM"}},
        {"zendesk", {"zendesk.com", {}, "CRM"}},
        {"freshdesk", {"freshdesk.com", {}, "CRM"}},
        {"pipedrive", {"pipedrive.com", {"pipe drive"}, "CRM"}},
        {"zoho", {"zoho.com", {}, "CRM"}},
        {"drift", {"drift.com", {}, "CRM"}},
        {"freshsales", {"freshworks.com", {"fresh sales", "freshworks"}, "CRM"}},

        // Cloud & Infrastructure
        {"aws", {"aws.amazon.com", {"amazon web services"}, "Cloud"}},
        {"gcp", {"cloud.google.com", {"google cloud", "google cloud platform"}, "Cloud"}},
        {"azure", {"azure.microsoft.com", {"microsoft azure"}, "Cloud"}},
        {"digitalocean", {"digitalocean.com", {"digital ocean", "do"}, "Cloud"}},
        {"heroku", {"heroku.com", {}, "Cloud"}},
        {"vercel", {"vercel.com", {"zeit"}, "Cloud"}},
        {"netlify", {"netlify.com", {}, "Cloud"}},
        {"cloudflare", {"cloudflare.com", {"cloud flare", "cf"}, "Cloud"}},
        {"linode", {"linode.com", {"akamai"}, "Cloud"}},
        {"render", {"render.com", {}, "Cloud"}},
        {"railway", {"railway.app", {}, "Cloud"}},
        {"supabase", {"supabase.com", {}, "Cloud"}},
        {"firebase", {"firebase.google.com", {}, "Cloud"}},
        {"planetscale", {"planetscale.com", {"planet scale"}, "Cloud"}},
        {"neon", {"neon.tech", {}, "Cloud"}},

        // Developer Tools
        {"github", {"github.com", {"gh"}, "DevTools"}},
        {"gitlab", {"gitlab.com", {"gl"}, "DevTools"}},
        {"bitbucket", {"bitbucket.org", {"bit bucket", "bb"}, "DevTools"}},
        {"jira", {"atlassian.com", {}, "DevTools"}},
        {"atlassian", {"atlassian.com", {}, "DevTools"}},
        {"confluence", {"atlassian.com/software/confluence", {}, "DevTools"}},
        {"docker", {"docker.com", {}, "DevTools"}},
        {"kubernetes", {"kubernetes.io", {"k8s"}, "DevTools"}},
        {"jenkins", {"jenkins.io", {}, "DevTools"}},
        {"circleci", {"circleci.com", {"circle ci"}, "DevTools"}},
        {"travisci", {"travis-ci.com", {"travis ci", "travis"}, "DevTools"}},
        {"sentry", {"sentry.io", {}, "DevTools"}},
        {"datadog", {"datadoghq.com", {"data dog"}, "DevTools"}},
        {"newrelic", {"newrelic.com", {"new relic"}, "DevTools"}},
        {"postman", {"postman.com", {}, "DevTools"}},
        {"insomnia", {"insomnia.rest", {}, "DevTools"}},
        {"terraform", {"terraform.io", {"tf"}, "DevTools"}},
        {"hashicorp", {"hashicorp.com", {}, "DevTools"}},
        {"grafana", {"grafana.com", {}, "DevTools"}},
        {"prometheus", {"prometheus.io", {}, "DevTools"}},
        {"elasticsearch", {"elastic.co", {"elastic", "elk"}, "DevTools"}},
        {"kibana", {"elastic.co/kibana", {}, "DevTools"}},
        {"redis", {"redis.io", {}, "DevTools"}},
        {"mongodb", {"mongodb.com", {"mongo"}, "DevTools"}},
        {"postgresql", {"postgresql.org", {"postgres", "pg"}, "DevTools"}},
        {"mysql", {"mysql.com", {}, "DevTools"}},
        {"sqlite", {"sqlite.org", {}, "DevTools"}},
        {"npm", {"npmjs.com", {}, "DevTools"}},
        {"yarn", {"yarnpkg.com", {}, "DevTools"}},
        {"webpack", {"webpack.js.org", {}, "DevTools"}},
        {"vite", {"vitejs.dev", {"vitejs"}, "DevTools"}},
        {"eslint", {"eslint.org", {}, "DevTools"}},
        {"prettier", {"prettier.io", {}, "DevTools"}},

        // Payments
        {"stripe", {"stripe.com", {}, "Payments"}},
        {"paypal", {"paypal.com", {"pay pal"}, "Payments"}},
        {"square", {"squareup.com", {"squareup"}, "Payments"}},
        {"braintree", {"braintreepayments.com", {"brain tree"}, "Payments"}},
        {"adyen", {"adyen.com", {}, "Payments"}},
        {"klarna", {"klarna.com", {}, "Payments"}},
        {"afterpay", {"afterpay.com", {"after pay"}, "Payments"}},
        {"razorpay", {"razorpay.com", {"razor pay"}, "Payments"}},
        {"plaid", {"plaid.com", {}, "Payments"}},
        {"wise", {"wise.com", {"transferwise"}, "Payments"}},

        // Communication & Collaboration
        {"slack", {"slack.com", {}, "Communication"}},
        {"discord", {"discord.com", {}, "Communication"}},
        {"teams", {"microsoft.com/en-us/microsoft-teams", {"microsoft teams", "ms teams"}, "Communication"}},
        {"zoom", {"zoom.us", {}, "Communication"}},
        {"telegram", {"telegram.org", {"tg"}, "Communication"}},
        {"whatsapp", {"whatsapp.com", {"what's app", "wa"}, "Communication"}},
        {"twilio", {"twilio.com", {}, "Communication"}},
        {"sendgrid", {"sendgrid.com", {"send grid"}, "Communication"}},
        {"mailgun", {"mailgun.com", {"mail gun"}, "Communication"}},
        {"notion", {"notion.so", {}, "Collaboration"}},
        {"airtable", {"airtable.com", {"air table"}, "Collaboration"}},
        {"asana", {"asana.com", {}, "Collaboration"}},
        {"trello", {"trello.com", {}, "Collaboration"}},
        {"monday", {"monday.com", {"monday.com"}, "Collaboration"}},
        {"clickup", {"clickup.com", {"click up"}, "Collaboration"}},
        {"basecamp", {"basecamp.com", {"base camp"}, "Collaboration"}},
        {"linear", {"linear.app", {}, "Collaboration"}},
        {"miro", {"miro.com", {}, "Collaboration"}},
        {"figma", {"figma.com", {}, "Collaboration"}},
        {"canva", {"canva.com", {}, "Collaboration"}},

        // AI & ML
        {"openai", {"openai.com", {"open ai", "chatgpt", "gpt"}, "AI"}},
        {"anthropic", {"anthropic.com", {"claude"}, "AI"}},
        {"google", {"google.com", {}, "AI"}},
        {"deepmind", {"deepmind.google", {"deep mind"}, "AI"}},
        {"huggingface", {"huggingface.co", {"hugging face", "hf"}, "AI"}},
        {"cohere", {"cohere.com", {}, "AI"}},
        {"replicate", {"replicate.com", {}, "AI"}},
        {"stability", {"stability.ai", {"stable diffusion", "stability ai"}, "AI"}},
        {"midjourney", {"midjourney.com", {"mid journey", "mj"}, "AI"}},
        {"cursor", {"cursor.com", {"cursor ai"}, "AI"}},
        {"perplexity", {"perplexity.ai", {}, "AI"}},
        {"mistral", {"mistral.ai", {"mistral ai"}, "AI"}},
        {"elevenlabs", {"elevenlabs.io", {"eleven labs", "11labs"}, "AI"}},

        // Analytics & Data
        {"googleanalytics", {"analytics.google.com", {"google analytics", "ga"}, "Analytics"}},
        {"mixpanel", {"mixpanel.com", {"mix panel"}, "Analytics"}},
        {"amplitude", {"amplitude.com", {}, "Analytics"}},
        {"segment", {"segment.com", {}, "Analytics"}},
        {"hotjar", {"hotjar.com", {"hot jar"}, "Analytics"}},
        {"looker", {"looker.com", {}, "Analytics"}},
        {"tableau", {"tableau.com", {}, "Analytics"}},
        {"powerbi", {"powerbi.microsoft.com", {"power bi", "microsoft power bi"}, "Analytics"}},
        {"snowflake", {"snowflake.com", {}, "Analytics"}},
        {"databricks", {"databricks.com", {"data bricks"}, "Analytics"}},
        {"dbt", {"getdbt.com", {"data build tool"}, "Analytics"}},

        // Social Media
        {"facebook", {"facebook.com", {"fb", "meta"}, "Social"}},
        {"instagram", {"instagram.com", {"ig", "insta"}, "Social"}},
        {"twitter", {"x.com", {"x", "x.com"}, "Social"}},
        {"linkedin", {"linkedin.com", {"linked in", "li"}, "Social"}},
        {"pinterest", {"pinterest.com", {}, "Social"}},
        {"tiktok", {"tiktok.com", {"tik tok"}, "Social"}},
        {"reddit", {"reddit.com", {}, "Social"}},
        {"youtube", {"youtube.com", {"yt"}, "Social"}},
        {"snapchat", {"snapchat.com", {"snap"}, "Social"}},
        {"threads", {"threads.net", {}, "Social"}},

        // Auth & Security
        {"auth0", {"auth0.com", {}, "Auth"}},
        {"okta", {"okta.com", {}, "Auth"}},
        {"clerk", {"clerk.com", {}, "Auth"}},
        {"stytch", {"stytch.com", {}, "Auth"}},
        {"onelogin", {"onelogin.com", {"one login"}, "Auth"}},
        {"duo", {"duo.com", {"duo security"}, "Auth"}},
        {"crowdstrike", {"crowdstrike.com", {"crowd strike"}, "Security"}},
        {"snyk", {"snyk.io", {}, "Security"}},
        {"vault", {"vaultproject.io", {"hashicorp vault"}, "Security"}},
        {"onepassword", {"1password.com", {"1password"}, "Security"}},
        {"lastpass", {"lastpass.com", {"last pass"}, "Security"}},

        // Design & UI
        {"sketch", {"sketch.com", {}, "Design"}},
        {"invision", {"invisionapp.com", {"in vision"}, "Design"}},
        {"zeplin", {"zeplin.io", {}, "Design"}},
        {"framer", {"framer.com", {}, "Design"}},
        {"storybook", {"storybook.js.org", {}, "Design"}},
        {"chromatic", {"chromatic.com", {}, "Design"}},
        {"adobe", {"adobe.com", {}, "Design"}},
        {"adobe xd", {"adobe.com", {"xd"}, "Design"}},

        // Frameworks & Languages
        {"react", {"react.dev", {"reactjs"}, "Framework"}},
        {"nextjs", {"nextjs.org", {"next.js", "next js", "next"}, "Framework"}},
        {"vue", {"vuejs.org", {"vuejs", "vue.js"}, "Framework"}},
        {"nuxt", {"nuxt.com", {"nuxtjs", "nuxt.js"}, "Framework"}},
        {"angular", {"angular.io", {"angularjs"}, "Framework"}},
        {"svelte", {"svelte.dev", {"sveltejs"}, "Framework"}},
        {"remix", {"remix.run", {"remix.run"}, "Framework"}},
        {"astro", {"astro.build", {"astro.build"}, "Framework"}},
        {"tailwindcss", {"tailwindcss.com", {"tailwind", "tailwind css"}, "Framework"}},
        {"bootstrap", {"getbootstrap.com", {}, "Framework"}},
        {"nodejs", {"nodejs.org", {"node.js", "node js", "node"}, "Framework"}},
        {"deno", {"deno.com", {}, "Framework"}},
        {"bun", {"bun.sh", {}, "Framework"}},
        {"python", {"python.org", {}, "Language"}},
        {"rust", {"rust-lang.org", {"rustlang"}, "Language"}},
        {"go", {"go.dev", {"golang"}, "Language"}},
        {"swift", {"swift.org", {}, "Language"}},
        {"kotlin", {"kotlinlang.org", {"kotlin lang"}, "Language"}},
        {"typescript", {"typescriptlang.org", {"ts"}, "Language"}},
        {"flutter", {"flutter.dev", {}, "Framework"}},
        {"django", {"djangoproject.com", {"django project"}, "Framework"}},
        {"flask", {"flask.palletsprojects.com", {}, "Framework"}},
        {"fastapi", {"fastapi.tiangolo.com", {"fast api"}, "Framework"}},
        {"rails", {"rubyonrails.org", {"ruby on rails", "ror"}, "Framework"}},
        {"laravel", {"laravel.com", {}, "Framework"}},
        {"spring", {"spring.io", {"spring boot"}, "Framework"}},
        {"express", {"expressjs.com", {"express.js", "expressjs"}, "Framework"}},

        // Storage & CDN
        {"s3", {"aws.amazon.com/s3", {"amazon s3", "aws s3"}, "Storage"}},
        {"cloudinary", {"cloudinary.com", {}, "Storage"}},
        {"imgix", {"imgix.com", {}, "Storage"}},
        {"uploadcare", {"uploadcare.com", {"upload care"}, "Storage"}},
        {"mux", {"mux.com", {}, "Storage"}},
        {"bunnycdn", {"bunny.net", {"bunny cdn", "bunny.net"}, "CDN"}},
        {"fastly", {"fastly.com", {}, "CDN"}},

        // CMS
        {"wordpress", {"wordpress.org", {"wp"}, "CMS"}},
        {"contentful", {"contentful.com", {}, "CMS"}},
        {"strapi", {"strapi.io", {}, "CMS"}},
        {"sanity", {"sanity.io", {}, "CMS"}},
        {"ghost", {"ghost.org", {}, "CMS"}},
        {"prismic", {"prismic.io", {}, "CMS"}},
        {"webflow", {"webflow.com", {"web flow"}, "CMS"}},
        {"drupal", {"drupal.org", {}, "CMS"}},
        {"directus", {"directus.io", {}, "CMS"}},

        // ERP & Business
        {"sap", {"sap.com", {}, "ERP"}},
        {"oracle", {"oracle.com", {}, "ERP"}},
        {"netsuite", {"netsuite.com", {"net suite"}, "ERP"}},
        {"quickbooks", {"quickbooks.intuit.com", {"quick books", "intuit"}, "ERP"}},
        {"xero", {"xero.com", {}, "ERP"}},
        {"freshbooks", {"freshbooks.com", {"fresh books"}, "ERP"}},

        // Misc Popular
        {"spotify", {"spotify.com", {}, "Entertainment"}},
        {"netflix", {"netflix.com", {}, "Entertainment"}},
        {"apple", {"apple.com", {}, "Tech"}},
        {"microsoft", {"microsoft.com", {"ms"}, "Tech"}},
        {"ibm", {"ibm.com", {}, "Tech"}},
        {"intel", {"intel.com", {}, "Tech"}},
        {"nvidia", {"nvidia.com", {}, "Tech"}},
        {"tesla", {"tesla.com", {}, "Tech"}},
        {"uber", {"uber.com", {}, "Tech"}},
        {"airbnb", {"airbnb.com", {}, "Tech"}},
        {"dropbox", {"dropbox.com", {}, "Tech"}},
        {"box", {"box.com", {}, "Tech"}},
        {"twitch", {"twitch.tv", {}, "Entertainment"}},
        {"epic", {"epicgames.com", {"epic games"}, "Entertainment"}},
        {"unity", {"unity.com", {"unity3d"}, "DevTools"}},
        {"unreal", {"unrealengine.com", {"unreal engine", "ue"}, "DevTools"}},
        {"godot", {"godotengine.org", {"godot engine"}, "DevTools"}},    };
}

} // namespace

CompanyDatabase::CompanyDatabase(std::vector<Record> records)
    : m_records(std::move(records)) {
    m_index.reserve(m_records.size());
    for (std::size_t i = 0; i < m_records.size(); ++i) {
        if (!m_index.emplace(m_records[i].first, i).second) {
            throw std::invalid_argument("Duplicate company key: " + m_records[i].first);
        }
    }
}

const CompanyDatabase& CompanyDatabase::Instance() {
    static const CompanyDatabase instance(BuiltInRecords());
    return instance;
}

const CompanyEntry* CompanyDatabase::find(const std::string& key) const {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_records[it->second].second;
}

std::vector<std::string> CompanyDatabase::categories() const {
    std::set<std::string> unique;
    for (const auto& record : m_records) {
        unique.insert(record.second.category);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

} // namespace logoscout::domain
